/**
 * @file profile.hpp
 * @brief Lightweight timing of named code sections
 *
 * Sections are timed with RAII guards and aggregated per name:
 * call count, total, last, min and max duration.
 *
 * Example usage:
 * @code
 * void update() {
 *     PROFILE_SCOPE("CollisionSystem::update");
 *     // ... code ...
 * }
 *
 * Profiling::Profiler::printStats();
 * @endcode
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <iostream>
#include <string>
#include <unordered_map>
#include <vector>

namespace Profiling {

/**
 * @brief Process-wide store of section timings. Not thread-safe; the
 *        game loop is the only caller.
 */
class Profiler {
public:
    using Clock     = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Duration  = std::chrono::nanoseconds;

    /**
     * @brief Aggregated timing statistics for a named section
     */
    struct ProfileData {
        Duration total_time{0};
        Duration last_time{0};         ///< Duration of the most recent call
        Duration min_time{Duration::max()};
        Duration max_time{0};
        uint64_t call_count{0};
    };

    /**
     * @brief Start timing a named section.
     * @param name Must be ended with endSection in LIFO order.
     */
    static void startSection(const std::string& name);

    /**
     * @brief Stop timing a named section.
     * @return Duration of this call, zero if @p name was not the innermost
     *         open section.
     */
    static Duration endSection(const std::string& name);

    /**
     * @brief Looks up collected data for a section.
     * @return nullptr if the section was never completed.
     */
    static const ProfileData* find(const std::string& name);

    /**
     * @brief Print one line per section, in first-seen order.
     */
    static void printStats(std::ostream& out = std::cout);

    /**
     * @brief Drop all recorded data.
     */
    static void reset();

private:
    struct SectionData {
        TimePoint start_time;
        ProfileData profile_data;
    };

    std::unordered_map<std::string, SectionData> sections;
    std::vector<std::string> order;        ///< Section names in first-seen order
    std::vector<std::string> scope_stack;  ///< Currently open sections

    Profiler() = default;

    static Profiler& getInstance();
};

/**
 * @brief RAII guard: starts the section on construction, ends it on destruction.
 */
class ScopedProfiler {
public:
    explicit ScopedProfiler(std::string name);
    ~ScopedProfiler();

    ScopedProfiler(const ScopedProfiler&) = delete;
    ScopedProfiler& operator=(const ScopedProfiler&) = delete;

private:
    std::string section_name;
};

/**
 * @brief Converts a profiler duration to fractional milliseconds.
 */
double toMilliseconds(Profiler::Duration d);

} // namespace Profiling

#define PROFILE_CONCAT_INNER(a, b) a##b
#define PROFILE_CONCAT(a, b) PROFILE_CONCAT_INNER(a, b)

#define PROFILE_SCOPE(name) \
    ::Profiling::ScopedProfiler PROFILE_CONCAT(_scopedProfiler, __LINE__) { name }
