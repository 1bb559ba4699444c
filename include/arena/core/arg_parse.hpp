#pragma once

namespace CommandLine {

/**
 * @brief Parses a non-negative decimal count from a command-line argument.
 *
 * The whole argument must be digits. Signs, whitespace, trailing text
 * and values outside unsigned long are rejected.
 * @return false on rejection, leaving @p out untouched
 */
bool parseCount(const char* text, unsigned long& out);

} // namespace CommandLine
