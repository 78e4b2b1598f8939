/**
 * @file profile.cpp
 * @brief Implementation of the profiling system described in profile.hpp
 */

#include "fountain/core/profile.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <utility>

namespace Profiling {

Profiler& Profiler::getInstance() {
    static Profiler instance;
    return instance;
}

void Profiler::startSection(const std::string& name) {
    auto& instance = getInstance();
    auto& stats = instance.sections[name];

    if (!instance.open.empty()) {
        const std::string& parent = instance.open.back().name;
        stats.parent = parent;
        auto& siblings = instance.sections[parent].children;
        if (std::find(siblings.begin(), siblings.end(), name) == siblings.end()) {
            siblings.push_back(name);
        }
    }

    instance.open.push_back({name, Clock::now()});
}

void Profiler::endSection(const std::string& name) {
    auto& instance = getInstance();

    if (instance.open.empty() || instance.open.back().name != name) {
        std::cerr << "[Profiler] endSection(\"" << name << "\") does not match the open section\n";
        return;
    }

    Duration const elapsed = Clock::now() - instance.open.back().started;
    instance.open.pop_back();

    auto& stats = instance.sections[name];
    stats.total += elapsed;
    stats.calls += 1;
    stats.fastest = std::min(stats.fastest, elapsed);
    stats.slowest = std::max(stats.slowest, elapsed);
}

const Profiler::SectionStats* Profiler::find(const std::string& name) {
    auto& instance = getInstance();
    auto it = instance.sections.find(name);
    return it == instance.sections.end() ? nullptr : &it->second;
}

void Profiler::printStats() {
    auto& instance = getInstance();
    std::cout << "\nProfiling Statistics:\n";

    std::vector<std::string> roots;
    for (const auto& [name, stats] : instance.sections) {
        if (stats.parent.empty()) {
            roots.push_back(name);
        }
    }
    std::sort(roots.begin(), roots.end());

    for (const auto& root : roots) {
        printSection(root, "");
    }
}

void Profiler::printSection(const std::string& name, const std::string& indent) {
    const auto& stats = getInstance().sections.at(name);

    double const totalMs = std::chrono::duration<double, std::milli>(stats.total).count();
    double const meanUs = stats.calls > 0
        ? std::chrono::duration<double, std::micro>(stats.total).count() / static_cast<double>(stats.calls)
        : 0.0;

    std::cout << indent << name << " [" << stats.calls << " calls] "
              << std::fixed << std::setprecision(2) << totalMs << "ms total, "
              << meanUs << "us mean\n";

    for (const auto& child : stats.children) {
        printSection(child, indent + "  ");
    }
}

void Profiler::reset() {
    auto& instance = getInstance();
    instance.sections.clear();
    instance.open.clear();
}

ScopedProfiler::ScopedProfiler(std::string name)
    : sectionName(std::move(name))
{
    Profiler::startSection(sectionName);
}

ScopedProfiler::~ScopedProfiler() {
    Profiler::endSection(sectionName);
}

} // namespace Profiling
