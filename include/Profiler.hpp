#ifndef PROFILER_HPP
#define PROFILER_HPP

// ============================================================================
// Profiling Configuration
// ============================================================================
// Define ENABLE_PROFILING to enable profiling. Defaults to disabled.
// Enable via: cmake -DENABLE_PROFILING=ON

#ifdef ENABLE_PROFILING

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <map>
#include <string>
#include <vector>

// ============================================================================
// Profiler - per-section call counts and wall time. Single-threaded: the
// AI is only ever driven by one game loop.
// ============================================================================

class Profiler {
public:
    struct SectionStats {
        uint64_t callCount = 0;
        double totalTimeNs = 0.0;
    };

    static Profiler& instance() {
        static Profiler profiler;
        return profiler;
    }

    void record(const char* section, double durationNs) {
        auto& stats = sections_[section];
        stats.callCount++;
        stats.totalTimeNs += durationNs;
    }

    const std::map<std::string, SectionStats>& getSections() const { return sections_; }

    void reset() { sections_.clear(); }

    void printReport() const {
        std::cout << "\n=== Profiler Report ===\n";
        if (sections_.empty()) {
            std::cout << "No profiling data collected.\n";
            return;
        }

        std::vector<std::pair<std::string, SectionStats>> sorted(sections_.begin(), sections_.end());
        std::sort(sorted.begin(), sorted.end(),
            [](const auto& a, const auto& b) {
                return a.second.totalTimeNs > b.second.totalTimeNs;
            });

        std::cout << std::left << std::setw(36) << "Section"
                  << std::right << std::setw(14) << "Total Time"
                  << std::setw(14) << "Calls"
                  << std::setw(14) << "Avg/Call"
                  << "\n";
        std::cout << std::string(78, '-') << "\n";

        for (const auto& [name, stats] : sorted) {
            double totalMs = stats.totalTimeNs / 1e6;
            double avgNs = stats.callCount > 0 ? stats.totalTimeNs / stats.callCount : 0.0;

            std::cout << std::left << std::setw(36) << name
                      << std::right << std::setw(11) << std::fixed << std::setprecision(2) << totalMs << " ms"
                      << std::setw(14) << stats.callCount
                      << std::setw(11) << std::fixed << std::setprecision(1) << avgNs << " ns"
                      << "\n";
        }
        std::cout << "\n";
    }

private:
    Profiler() = default;
    Profiler(const Profiler&) = delete;
    Profiler& operator=(const Profiler&) = delete;

    std::map<std::string, SectionStats> sections_;
};

// ============================================================================
// ScopedTimer - RAII helper that records timing when it goes out of scope
// ============================================================================

class ScopedTimer {
public:
    explicit ScopedTimer(const char* section)
        : section_(section)
        , start_(std::chrono::steady_clock::now()) {
    }

    ~ScopedTimer() {
        auto end = std::chrono::steady_clock::now();
        Profiler::instance().record(section_, std::chrono::duration<double, std::nano>(end - start_).count());
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    const char* section_;
    std::chrono::steady_clock::time_point start_;
};

#define PROFILER_CONCAT_INNER(a, b) a##b
#define PROFILER_CONCAT(a, b) PROFILER_CONCAT_INNER(a, b)
#define PROFILE_SCOPE(name) ScopedTimer PROFILER_CONCAT(_profiler_timer_, __LINE__)(name)

#else // ENABLE_PROFILING not defined

// ============================================================================
// Stub Profiler - No-op when profiling disabled
// ============================================================================

class Profiler {
public:
    static Profiler& instance() {
        static Profiler profiler;
        return profiler;
    }
    void printReport() const {}  // No-op
    void reset() {}              // No-op
};

#define PROFILE_SCOPE(name) ((void)0)

#endif // ENABLE_PROFILING

#endif // PROFILER_HPP
