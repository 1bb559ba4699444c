#pragma once

#include <iostream>

// Set to 1 to compile in debug-level messages, 0 to strip them
#ifndef ARENA_ENABLE_DEBUG_LOG
#define ARENA_ENABLE_DEBUG_LOG 0
#endif

namespace Logging {

enum class Level {
    Debug = 0,
    Info,
    Warning,
    Error,
    None
};

/**
 * @brief Sets the minimum level that is written. Defaults to Info.
 */
void setLevel(Level level);
Level level();

bool enabled(Level level);

/**
 * @brief Redirects all output to @p out. Pass nullptr to restore the
 *        default std::cout / std::cerr routing.
 */
void setStream(std::ostream* out);

/**
 * @brief Stream for a level: warnings and errors go to std::cerr,
 *        everything else to std::cout, unless redirected.
 */
std::ostream& stream(Level level);

const char* levelTag(Level level);

} // namespace Logging

#define ARENA_LOG(level, x) do { \
    if (::Logging::enabled(level)) { \
        ::Logging::stream(level) << "[" << ::Logging::levelTag(level) << "] " << x << '\n'; \
    } \
} while(0)

#if ARENA_ENABLE_DEBUG_LOG
#define ARENA_LOG_DEBUG(x) ARENA_LOG(::Logging::Level::Debug, x)
#else
#define ARENA_LOG_DEBUG(x) do {} while(0)
#endif

#define ARENA_LOG_INFO(x)  ARENA_LOG(::Logging::Level::Info, x)
#define ARENA_LOG_WARN(x)  ARENA_LOG(::Logging::Level::Warning, x)
#define ARENA_LOG_ERROR(x) ARENA_LOG(::Logging::Level::Error, x)
