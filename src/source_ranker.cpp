#include "source_ranker.hpp"
#include "console.h"
#include "file_utils.hpp"
#include <algorithm>
#include <ctime>
#include <nlohmann/json.hpp>

namespace PakForge {

using json = nlohmann::json;

SourceRanker::SourceRanker(std::vector<std::string> baseUrls) {
    for (auto& url : baseUrls) {
        ContentSource source;
        source.baseUrl = std::move(url);
        m_sources.push_back(std::move(source));
    }
}

// Lower tier ranks first
static int tierOf(const ContentSource& s) {
    if (s.failures > 0) return 3;
    if (!s.reachable) return 2;
    if (!s.speedKBps) return 1;
    return 0;
}

std::vector<std::string> SourceRanker::rank() const {
    std::vector<ContentSource> sources = snapshot();

    std::stable_sort(sources.begin(), sources.end(),
                     [](const ContentSource& a, const ContentSource& b) {
        int ta = tierOf(a);
        int tb = tierOf(b);
        if (ta != tb) return ta < tb;
        if (ta == 0) {
            if (*a.speedKBps != *b.speedKBps) return *a.speedKBps > *b.speedKBps;
            return a.latencyMs.value_or(INT64_MAX) < b.latencyMs.value_or(INT64_MAX);
        }
        if (ta == 3) return a.failures < b.failures;
        return false;
    });

    std::vector<std::string> urls;
    urls.reserve(sources.size());
    for (const auto& s : sources) urls.push_back(s.baseUrl);
    return urls;
}

std::vector<ContentSource> SourceRanker::snapshot() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_sources;
}

ContentSource* SourceRanker::find(const std::string& baseUrl) {
    for (auto& s : m_sources) {
        if (s.baseUrl == baseUrl) return &s;
    }
    return nullptr;
}

void SourceRanker::recordMeasurement(const std::string& baseUrl, int64_t latencyMs, double speedKBps) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (auto* s = find(baseUrl)) {
        s->latencyMs = latencyMs;
        s->speedKBps = speedKBps;
        s->reachable = true;
        s->measuredAt = static_cast<int64_t>(std::time(nullptr));
    }
}

void SourceRanker::recordUnreachable(const std::string& baseUrl) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (auto* s = find(baseUrl)) {
        s->reachable = false;
        s->speedKBps.reset();
        s->latencyMs.reset();
        s->measuredAt = static_cast<int64_t>(std::time(nullptr));
    }
}

void SourceRanker::reportFailure(const std::string& baseUrl) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (auto* s = find(baseUrl)) {
        s->failures++;
        Console::debug("Demoted source ", baseUrl, " (failures: ", s->failures, ")");
    }
}

void SourceRanker::reportSuccess(const std::string& baseUrl) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (auto* s = find(baseUrl)) {
        s->failures = 0;
    }
}

Status SourceRanker::saveMeasurements(const fs::path& path) const {
    json root;
    root["sources"] = json::array();
    for (const auto& s : snapshot()) {
        if (s.measuredAt == 0) continue;
        json entry;
        entry["baseUrl"] = s.baseUrl;
        entry["reachable"] = s.reachable;
        entry["measuredAt"] = s.measuredAt;
        if (s.speedKBps) entry["speedKBps"] = *s.speedKBps;
        if (s.latencyMs) entry["latencyMs"] = *s.latencyMs;
        root["sources"].push_back(entry);
    }
    try {
        fs::create_directories(path.parent_path());
    } catch (const std::exception& e) {
        return Status::failure(ErrorKind::InvalidInput, e.what());
    }
    return writeFile(path, root.dump(2));
}

bool SourceRanker::loadMeasurements(const fs::path& path, std::chrono::seconds maxAge) {
    std::string text = readFile(path.string());
    if (text.empty()) return false;

    json root;
    try {
        root = json::parse(text);
    } catch (const json::exception& e) {
        Console::warn("Ignoring unreadable source measurements ", path.string(), ": ", e.what());
        return false;
    }
    if (!root.contains("sources") || !root["sources"].is_array()) return false;

    const int64_t now = static_cast<int64_t>(std::time(nullptr));
    bool loaded = false;
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& entry : root["sources"]) {
        if (!entry.is_object()) continue;
        ContentSource read;
        try {
            read.baseUrl = entry.value("baseUrl", "");
            read.measuredAt = entry.value("measuredAt", int64_t(0));
            read.reachable = entry.value("reachable", true);
            if (entry.contains("speedKBps")) read.speedKBps = entry["speedKBps"].get<double>();
            if (entry.contains("latencyMs")) read.latencyMs = entry["latencyMs"].get<int64_t>();
        } catch (const json::exception& e) {
            Console::warn("Skipping malformed source measurement in ", path.string(), ": ", e.what());
            continue;
        }
        auto* s = find(read.baseUrl);
        if (!s) continue;
        if (read.measuredAt <= 0 || now - read.measuredAt > maxAge.count()) continue;
        s->measuredAt = read.measuredAt;
        s->reachable = read.reachable;
        if (read.speedKBps) s->speedKBps = read.speedKBps;
        if (read.latencyMs) s->latencyMs = read.latencyMs;
        loaded = true;
    }
    return loaded;
}

} // namespace PakForge
