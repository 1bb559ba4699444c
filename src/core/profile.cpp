/**
 * @file profile.cpp
 * @brief Implementation of the section profiler described in profile.hpp
 */

#include "arena/core/profile.hpp"
#include "arena/core/log.hpp"

#include <iomanip>
#include <utility>

namespace Profiling {

Profiler& Profiler::getInstance() {
    static Profiler instance;
    return instance;
}

void Profiler::startSection(const std::string& name) {
    auto& instance = getInstance();

    auto inserted = instance.sections.emplace(name, SectionData{});
    if (inserted.second) {
        instance.order.push_back(name);
    }

    inserted.first->second.start_time = Clock::now();
    instance.scope_stack.push_back(name);
}

Profiler::Duration Profiler::endSection(const std::string& name) {
    auto endTime = Clock::now();
    auto& instance = getInstance();

    if (instance.scope_stack.empty()) {
        ARENA_LOG_WARN("[Profiler] endSection(\"" << name << "\") but no section is open");
        return Duration{0};
    }
    if (instance.scope_stack.back() != name) {
        ARENA_LOG_WARN("[Profiler] endSection(\"" << name
                       << "\") but innermost section is \"" << instance.scope_stack.back() << "\"");
        return Duration{0};
    }
    instance.scope_stack.pop_back();

    auto& data = instance.sections[name].profile_data;
    Duration const duration =
        std::chrono::duration_cast<Duration>(endTime - instance.sections[name].start_time);

    data.total_time += duration;
    data.last_time = duration;
    data.call_count += 1;
    if (duration < data.min_time) {
        data.min_time = duration;
    }
    if (duration > data.max_time) {
        data.max_time = duration;
    }
    return duration;
}

const Profiler::ProfileData* Profiler::find(const std::string& name) {
    const auto& instance = getInstance();
    auto it = instance.sections.find(name);
    if (it == instance.sections.end() || it->second.profile_data.call_count == 0) {
        return nullptr;
    }
    return &it->second.profile_data;
}

void Profiler::printStats(std::ostream& out) {
    const auto& instance = getInstance();
    out << "\nProfiling Statistics:\n";

    for (const auto& name : instance.order) {
        const auto& pd = instance.sections.at(name).profile_data;
        if (pd.call_count == 0) {
            continue;
        }
        double const avgMs = toMilliseconds(pd.total_time) / static_cast<double>(pd.call_count);
        out << "  " << name << " [" << pd.call_count << " calls] "
            << std::fixed << std::setprecision(3)
            << "total " << toMilliseconds(pd.total_time) << "ms, "
            << "avg " << avgMs << "ms, "
            << "min " << toMilliseconds(pd.min_time) << "ms, "
            << "max " << toMilliseconds(pd.max_time) << "ms\n";
    }
}

void Profiler::reset() {
    auto& instance = getInstance();
    instance.sections.clear();
    instance.order.clear();
    instance.scope_stack.clear();
}

double toMilliseconds(Profiler::Duration d) {
    return std::chrono::duration<double, std::milli>(d).count();
}

// ------------------ ScopedProfiler RAII Wrapper ------------------

ScopedProfiler::ScopedProfiler(std::string name)
    : section_name(std::move(name))
{
    Profiler::startSection(section_name);
}

ScopedProfiler::~ScopedProfiler() {
    Profiler::endSection(section_name);
}

} // namespace Profiling
