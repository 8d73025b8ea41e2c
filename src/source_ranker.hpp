#pragma once

#include "errors.hpp"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace PakForge {

namespace fs = std::filesystem;

struct ContentSource {
    std::string baseUrl;
    std::optional<double> speedKBps;
    std::optional<int64_t> latencyMs;
    bool reachable = true;
    int failures = 0;          // session-only demotion count
    int64_t measuredAt = 0;    // unix seconds, 0 = never
};

// Ordered list of interchangeable mirrors. Holds no I/O of its own: callers
// feed it measurements and failures, and it answers with an ordering.
//
// Order: measured reachable sources fastest first (ties by lower latency),
// then unmeasured sources in configuration order, then unreachable ones,
// then demoted sources by ascending failure count.
class SourceRanker {
public:
    explicit SourceRanker(std::vector<std::string> baseUrls);

    std::vector<std::string> rank() const;
    std::vector<ContentSource> snapshot() const;

    void recordMeasurement(const std::string& baseUrl, int64_t latencyMs, double speedKBps);
    void recordUnreachable(const std::string& baseUrl);

    // Demote for the rest of this session; never persisted
    void reportFailure(const std::string& baseUrl);
    void reportSuccess(const std::string& baseUrl);

    // Measurement cache (latency/speed only, no failures)
    Status saveMeasurements(const fs::path& path) const;
    bool loadMeasurements(const fs::path& path, std::chrono::seconds maxAge);

private:
    ContentSource* find(const std::string& baseUrl);

    mutable std::mutex m_mutex;
    std::vector<ContentSource> m_sources;
};

} // namespace PakForge
