#include "arena/core/arg_parse.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>

namespace CommandLine {

bool parseCount(const char* text, unsigned long& out) {
    // strtoul would accept "-5" and wrap it around
    if (text == nullptr || !std::isdigit(static_cast<unsigned char>(text[0]))) {
        return false;
    }
    char* end = nullptr;
    errno = 0;
    unsigned long const value = std::strtoul(text, &end, 10);
    if (errno == ERANGE || *end != '\0') {
        return false;
    }
    out = value;
    return true;
}

} // namespace CommandLine
