/**
 * @file profile.hpp
 * @brief Per-step timing for the simulation tick
 *
 * Each named section accumulates total time, call count and the fastest and
 * slowest call. Sections nest: a section opened while another is running is
 * reported under it.
 *
 * Example usage:
 * @code
 * void SpawnScheduler::maybeSpawn(...) {
 *     PROFILE_SCOPE("SpawnScheduler");
 *     // ...
 * }
 *
 * Profiling::Profiler::printStats();
 * @endcode
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace Profiling {

/**
 * @brief Process-wide collection of section timings.
 *
 * Singleton; use the static methods.
 */
class Profiler {
public:
    using Clock    = std::chrono::steady_clock;
    using Duration = std::chrono::nanoseconds;

    /**
     * @brief Aggregated timings of one named section
     */
    struct SectionStats {
        Duration total{0};
        uint64_t calls{0};
        Duration fastest{Duration::max()};
        Duration slowest{0};
        std::string parent;                ///< Empty for top-level sections
        std::vector<std::string> children; ///< In first-seen order
    };

    /**
     * @brief Open a section. Must be closed with endSection in LIFO order.
     */
    static void startSection(const std::string& name);

    /**
     * @brief Close the most recently opened section.
     */
    static void endSection(const std::string& name);

    /**
     * @brief Returns the stats of a section, or nullptr if it was never opened.
     */
    static const SectionStats* find(const std::string& name);

    /**
     * @brief Print the section tree with call counts and mean times to stdout.
     */
    static void printStats();

    static void reset();

private:
    struct OpenSection {
        std::string name;
        Clock::time_point started;
    };

    std::unordered_map<std::string, SectionStats> sections;
    std::vector<OpenSection> open;

    Profiler() = default;
    static Profiler& getInstance();

    static void printSection(const std::string& name, const std::string& indent);
};

/**
 * @brief RAII guard around startSection/endSection.
 */
class ScopedProfiler {
public:
    explicit ScopedProfiler(std::string name);
    ~ScopedProfiler();

    ScopedProfiler(const ScopedProfiler&) = delete;
    ScopedProfiler& operator=(const ScopedProfiler&) = delete;

private:
    std::string sectionName;
};

} // namespace Profiling

#define FOUNTAIN_PROFILE_CONCAT_INNER(a, b) a##b
#define FOUNTAIN_PROFILE_CONCAT(a, b) FOUNTAIN_PROFILE_CONCAT_INNER(a, b)

/**
 * @brief Times the enclosing scope under @p name.
 */
#define PROFILE_SCOPE(name) \
    ::Profiling::ScopedProfiler FOUNTAIN_PROFILE_CONCAT(scopedProfiler_, __LINE__) { name }
