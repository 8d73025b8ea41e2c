#pragma once

#include "cancellation.hpp"
#include "errors.hpp"
#include "http_client.hpp"
#include "source_ranker.hpp"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>

namespace PakForge {

namespace fs = std::filesystem;

struct FetchResult {
    fs::path localPath;
    uintmax_t byteSize = 0;
    std::string sourceUrl;       // empty when served from cache
    bool fromCache = false;
    int fallbacksAttempted = 0;
};

struct FetchCallbacks {
    std::function<void(uint64_t received, uint64_t total)> onProgress;
    // Called from the stall monitor thread once per attempt
    std::function<void(const std::string&)> onStallWarning;
};

struct FetcherOptions {
    fs::path cacheRoot;
    std::chrono::milliseconds overallTimeout{std::chrono::minutes(10)};
    std::chrono::milliseconds stallTimeout{std::chrono::seconds(30)};
    std::chrono::milliseconds stallWarning{std::chrono::seconds(10)};
    std::chrono::milliseconds monitorInterval{250};
    int retriesPerSource = 1;
    std::chrono::milliseconds initialBackoff{500};
    std::chrono::milliseconds maxBackoff{5000};
    uintmax_t minimumSize = 1024;
    // Structural check for a finished download; defaults to validateZipArchive
    std::function<Status(const fs::path&)> validator;
};

// Non-trivial size and a zip container with at least one entry
Status validateZipArchive(const fs::path& path, uintmax_t minimumSize = 1024);

// Downloads one asset by walking the ranked mirrors. Each attempt runs a
// stall monitor beside the transfer; both share one cancellation source so a
// stall, the overall deadline or the caller's token stops the transfer.
class ResilientFetcher {
public:
    ResilientFetcher(HttpTransport& transport, SourceRanker& ranker, FetcherOptions options);

    Result<FetchResult> fetch(const std::string& assetPath, const std::string& cacheKey,
                              const FetchCallbacks& callbacks = {},
                              const CancellationToken& token = {});

    fs::path cachePath(const std::string& cacheKey) const;
    bool clearCache(const std::string& cacheKey);
    void clearAll();

    // Measure every mirror by downloading a small asset, in parallel
    void probeSources(const std::string& probeAsset, const CancellationToken& token = {});

private:
    struct AttemptOutcome {
        bool ok = false;
        bool stalled = false;
        bool timedOut = false;
        bool cancelled = false;
        bool transient = false;
        uint64_t bytes = 0;
        std::string message;
    };

    AttemptOutcome attempt(const std::string& url, const fs::path& partPath,
                           const FetchCallbacks& callbacks, const CancellationToken& token);
    Status validate(const fs::path& path) const;

    HttpTransport& m_transport;
    SourceRanker& m_ranker;
    FetcherOptions m_options;
};

} // namespace PakForge
