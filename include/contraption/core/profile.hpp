/**
 * @file profile.hpp
 * @brief Lightweight scope timer for the frame pipeline
 *
 * Example usage:
 * @code
 * void SimManager::update(double dt) {
 *     PROFILE_SCOPE("SimManager::update");
 *     // ... code ...
 * }
 *
 * Profiling::Profiler::printStats();
 * @endcode
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <utility>
#include <unordered_map>
#include <vector>

namespace Profiling {

/**
 * @brief Collects timing data across the application.
 *
 * Singleton; use the static methods to record sections and to print/reset the
 * statistics.
 */
class Profiler {
public:
    using Clock     = std::chrono::steady_clock;
    using TimePoint = std::chrono::time_point<Clock>;
    using Duration  = std::chrono::nanoseconds;

    /**
     * @brief Aggregated timing statistics for a named scope
     */
    struct ProfileData {
        Duration total_time{0};
        uint64_t call_count{0};
        Duration min_time{Duration::max()};
        Duration max_time{0};
    };

    /**
     * @brief Adds one measured duration to the named section.
     */
    static void record(const std::string& name, Duration duration);

    /**
     * @brief Print a table of all sections, slowest first, to stdout.
     */
    static void printStats();

    /**
     * @brief Reset all recorded profiling data.
     */
    static void reset();

    /**
     * @brief Returns a copy of the data for one section (zeroed if unknown).
     */
    static ProfileData get(const std::string& name);

private:
    std::unordered_map<std::string, ProfileData> sections;
    std::vector<std::string> order;  // first-seen order, for stable output

    Profiler() = default;

    static Profiler& getInstance();
};

/**
 * @brief RAII helper, times the enclosing scope.
 */
class ScopedTimer {
public:
    explicit ScopedTimer(std::string name)
        : name(std::move(name)), start(Profiler::Clock::now()) {}

    ~ScopedTimer() {
        Profiler::record(name, Profiler::Clock::now() - start);
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    std::string name;
    Profiler::TimePoint start;
};

} // namespace Profiling

#define PROFILE_CONCAT_INNER(a, b) a##b
#define PROFILE_CONCAT(a, b) PROFILE_CONCAT_INNER(a, b)
#define PROFILE_SCOPE(name) \
    Profiling::ScopedTimer PROFILE_CONCAT(profileScope_, __LINE__)(name)
