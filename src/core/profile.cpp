/**
 * @file profile.cpp
 * @brief Implementation of the profiler described in profile.hpp
 */

#include "contraption/core/profile.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>

namespace Profiling {

Profiler& Profiler::getInstance() {
    static Profiler instance;
    return instance;
}

void Profiler::record(const std::string& name, Duration duration) {
    auto& instance = getInstance();
    auto it = instance.sections.find(name);
    if (it == instance.sections.end()) {
        it = instance.sections.emplace(name, ProfileData{}).first;
        instance.order.push_back(name);
    }

    ProfileData& data = it->second;
    data.total_time += duration;
    data.call_count++;
    data.min_time = std::min(data.min_time, duration);
    data.max_time = std::max(data.max_time, duration);
}

Profiler::ProfileData Profiler::get(const std::string& name) {
    auto& instance = getInstance();
    auto it = instance.sections.find(name);
    if (it == instance.sections.end()) {
        return ProfileData{};
    }
    return it->second;
}

void Profiler::printStats() {
    auto& instance = getInstance();
    if (instance.order.empty()) {
        return;
    }

    std::vector<std::string> names = instance.order;
    std::stable_sort(names.begin(), names.end(), [&](const std::string& a, const std::string& b) {
        return instance.sections[a].total_time > instance.sections[b].total_time;
    });

    auto toMs = [](Duration d) {
        return std::chrono::duration<double, std::milli>(d).count();
    };

    std::cout << "\n=== Profile ===\n"
              << std::left << std::setw(32) << "Section"
              << std::right << std::setw(10) << "Calls"
              << std::setw(12) << "Total ms"
              << std::setw(10) << "Avg ms"
              << std::setw(10) << "Min ms"
              << std::setw(10) << "Max ms" << "\n";

    for (const auto& name : names) {
        const ProfileData& data = instance.sections[name];
        double const avg = data.call_count > 0 ? toMs(data.total_time) / data.call_count : 0.0;
        std::cout << std::left << std::setw(32) << name
                  << std::right << std::setw(10) << data.call_count
                  << std::fixed << std::setprecision(3)
                  << std::setw(12) << toMs(data.total_time)
                  << std::setw(10) << avg
                  << std::setw(10) << toMs(data.min_time)
                  << std::setw(10) << toMs(data.max_time) << "\n";
    }
    std::cout.unsetf(std::ios::fixed);
}

void Profiler::reset() {
    auto& instance = getInstance();
    instance.sections.clear();
    instance.order.clear();
}

} // namespace Profiling
