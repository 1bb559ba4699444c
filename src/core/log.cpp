#include "arena/core/log.hpp"

namespace Logging {

namespace {

Level& currentLevel() {
    static Level s_level = Level::Info;
    return s_level;
}

std::ostream*& redirect() {
    static std::ostream* s_out = nullptr;
    return s_out;
}

} // namespace

void setLevel(Level level) {
    currentLevel() = level;
}

Level level() {
    return currentLevel();
}

bool enabled(Level level) {
    return level != Level::None &&
           static_cast<int>(level) >= static_cast<int>(currentLevel());
}

void setStream(std::ostream* out) {
    redirect() = out;
}

std::ostream& stream(Level level) {
    if (redirect() != nullptr) {
        return *redirect();
    }
    if (level == Level::Warning || level == Level::Error) {
        return std::cerr;
    }
    return std::cout;
}

const char* levelTag(Level level) {
    switch (level) {
        case Level::Debug:   return "DEBUG";
        case Level::Info:    return "INFO";
        case Level::Warning: return "WARN";
        case Level::Error:   return "ERROR";
        default:             return "LOG";
    }
}

} // namespace Logging
