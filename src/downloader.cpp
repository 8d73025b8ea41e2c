#include "downloader.hpp"
#include "console.h"
#include "file_utils.hpp"
#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <fstream>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>
#include <zip.h>

namespace PakForge {

using Clock = std::chrono::steady_clock;

// ============================================================================
// Artifact validation
// ============================================================================

Status validateZipArchive(const fs::path& path, uintmax_t minimumSize) {
    std::error_code ec;
    uintmax_t size = fs::file_size(path, ec);
    if (ec) {
        return Status::failure(ErrorKind::CorruptArtifact, "cannot read " + path.string() + ": " + ec.message());
    }
    if (size < minimumSize) {
        return Status::failure(ErrorKind::CorruptArtifact,
                               path.filename().string() + " is too small (" + std::to_string(size) + " bytes)");
    }

    int err = 0;
    zip_t* raw = zip_open(path.c_str(), ZIP_RDONLY | ZIP_CHECKCONS, &err);
    if (!raw) {
        zip_error_t zerr;
        zip_error_init_with_code(&zerr, err);
        std::string reason = zip_error_strerror(&zerr);
        zip_error_fini(&zerr);
        return Status::failure(ErrorKind::CorruptArtifact,
                               path.filename().string() + " is not a valid zip archive: " + reason);
    }
    std::unique_ptr<zip_t, decltype(&zip_discard)> archive(raw, &zip_discard);

    if (zip_get_num_entries(archive.get(), 0) <= 0) {
        return Status::failure(ErrorKind::CorruptArtifact, path.filename().string() + " contains no entries");
    }
    return Status::success();
}

// ============================================================================
// ResilientFetcher
// ============================================================================

ResilientFetcher::ResilientFetcher(HttpTransport& transport, SourceRanker& ranker, FetcherOptions options)
    : m_transport(transport), m_ranker(ranker), m_options(std::move(options)) {}

fs::path ResilientFetcher::cachePath(const std::string& cacheKey) const {
    return m_options.cacheRoot / cacheKey;
}

bool ResilientFetcher::clearCache(const std::string& cacheKey) {
    std::error_code ec;
    bool removed = fs::remove(cachePath(cacheKey), ec);
    fs::path part = cachePath(cacheKey);
    part += ".part";
    fs::remove(part, ec);
    return removed;
}

void ResilientFetcher::clearAll() {
    removeTreeQuietly(m_options.cacheRoot);
}

Status ResilientFetcher::validate(const fs::path& path) const {
    if (m_options.validator) {
        return m_options.validator(path);
    }
    return validateZipArchive(path, m_options.minimumSize);
}

Result<FetchResult> ResilientFetcher::fetch(const std::string& assetPath, const std::string& cacheKey,
                                            const FetchCallbacks& callbacks,
                                            const CancellationToken& token) {
    const fs::path cached = cachePath(cacheKey);
    fs::path part = cached;
    part += ".part";
    std::error_code ec;

    if (fs::exists(cached, ec)) {
        Status check = validate(cached);
        if (check.ok()) {
            Console::log("Using cached ", cacheKey);
            FetchResult result;
            result.localPath = cached;
            result.byteSize = fs::file_size(cached, ec);
            result.fromCache = true;
            return Result<FetchResult>::success(result);
        }
        Console::warn("Discarding cached ", cacheKey, ": ", check.message());
        fs::remove(cached, ec);
    }

    fs::create_directories(cached.parent_path(), ec);
    if (ec) {
        return Result<FetchResult>::failure(ErrorKind::InvalidInput,
                                            "cannot create cache directory " + cached.parent_path().string() +
                                                ": " + ec.message());
    }

    const std::vector<std::string> sources = m_ranker.rank();
    if (sources.empty()) {
        return Result<FetchResult>::failure(ErrorKind::SourceExhausted, "no content sources configured");
    }

    std::string lastError = "no attempt made";
    int fallbacks = 0;

    for (size_t i = 0; i < sources.size(); ++i) {
        const std::string& base = sources[i];
        const std::string url = joinUrl(base, assetPath);
        if (i > 0) {
            ++fallbacks;
            Console::log("Falling back to ", base);
        }

        auto backoff = m_options.initialBackoff;
        for (int retry = 0;; ++retry) {
            if (token.isCancelled()) {
                fs::remove(part, ec);
                return Result<FetchResult>::failure(ErrorKind::Cancelled, "download cancelled");
            }

            Console::log("Downloading ", url, retry > 0 ? " (retry " + std::to_string(retry) + ")" : "");
            AttemptOutcome outcome = attempt(url, part, callbacks, token);

            if (outcome.ok) {
                Status check = validate(part);
                if (check.ok()) {
                    fs::rename(part, cached, ec);
                    if (ec) {
                        fs::remove(part, ec);
                        return Result<FetchResult>::failure(ErrorKind::CorruptArtifact,
                                                            "cannot store download in cache: " + ec.message());
                    }
                    m_ranker.reportSuccess(base);
                    FetchResult result;
                    result.localPath = cached;
                    result.byteSize = outcome.bytes;
                    result.sourceUrl = url;
                    result.fallbacksAttempted = fallbacks;
                    Console::log("Downloaded ", cacheKey, " (", outcome.bytes, " bytes) from ", base);
                    return Result<FetchResult>::success(result);
                }
                fs::remove(part, ec);
                lastError = base + ": " + check.message();
                Console::warn("Rejected download from ", base, ": ", check.message());
                break;
            }

            fs::remove(part, ec);
            if (outcome.cancelled) {
                return Result<FetchResult>::failure(ErrorKind::Cancelled, "download cancelled");
            }

            lastError = base + ": " + outcome.message;
            Console::warn("Download from ", base, " failed: ", outcome.message);

            if (outcome.transient && retry < m_options.retriesPerSource) {
                if (!sleepFor(backoff, token)) {
                    return Result<FetchResult>::failure(ErrorKind::Cancelled, "download cancelled");
                }
                backoff = std::min(backoff * 2, m_options.maxBackoff);
                continue;
            }
            break;
        }

        m_ranker.reportFailure(base);
    }

    return Result<FetchResult>::failure(ErrorKind::SourceExhausted,
                                        "all " + std::to_string(sources.size()) +
                                            " content sources failed; last error: " + lastError);
}

ResilientFetcher::AttemptOutcome ResilientFetcher::attempt(const std::string& url, const fs::path& partPath,
                                                           const FetchCallbacks& callbacks,
                                                           const CancellationToken& token) {
    AttemptOutcome outcome;

    std::ofstream out(partPath, std::ios::binary | std::ios::trunc);
    if (!out) {
        outcome.message = "cannot open " + partPath.string() + " for writing";
        return outcome;
    }

    CancellationSource attemptCancel = CancellationSource::linkedTo(token);
    const auto start = Clock::now();
    std::atomic<Clock::rep> lastByte{start.time_since_epoch().count()};
    std::atomic<bool> stalled{false};
    std::atomic<bool> timedOut{false};
    std::mutex monitorMutex;
    std::condition_variable monitorCv;
    bool finished = false;

    std::thread monitor([&] {
        bool warned = false;
        std::unique_lock<std::mutex> lock(monitorMutex);
        while (!finished) {
            monitorCv.wait_for(lock, m_options.monitorInterval);
            if (finished) break;

            auto now = Clock::now();
            auto idle = now - Clock::time_point(Clock::duration(lastByte.load()));
            if (now - start >= m_options.overallTimeout) {
                timedOut = true;
                attemptCancel.cancel();
                break;
            }
            if (idle >= m_options.stallTimeout) {
                stalled = true;
                attemptCancel.cancel();
                break;
            }
            if (!warned && idle >= m_options.stallWarning) {
                warned = true;
                auto secs = std::chrono::duration_cast<std::chrono::seconds>(idle).count();
                std::string warning = "No data received from " + url + " for " + std::to_string(secs) + "s";
                lock.unlock();
                Console::warn(warning);
                if (callbacks.onStallWarning) callbacks.onStallWarning(warning);
                lock.lock();
            }
        }
    });

    // The monitor is joined on every path out of this function
    struct MonitorJoin {
        std::thread& thread;
        std::mutex& mutex;
        std::condition_variable& cv;
        bool& finished;
        ~MonitorJoin() {
            {
                std::lock_guard<std::mutex> lock(mutex);
                finished = true;
            }
            cv.notify_all();
            if (thread.joinable()) thread.join();
        }
    };

    bool writeFailed = false;
    HttpResult response;
    {
        MonitorJoin join{monitor, monitorMutex, monitorCv, finished};

        HttpRequest request;
        request.url = url;
        request.timeout = m_options.overallTimeout;

        response = m_transport.get(request, [&](const char* data, size_t size) {
            out.write(data, static_cast<std::streamsize>(size));
            if (!out) {
                writeFailed = true;
                return false;
            }
            lastByte = Clock::now().time_since_epoch().count();
            outcome.bytes += size;
            if (callbacks.onProgress) callbacks.onProgress(outcome.bytes, 0);
            return true;
        }, attemptCancel.token());
    }
    out.close();

    if (response.ok && !writeFailed && out) {
        outcome.ok = true;
        return outcome;
    }

    if (token.isCancelled()) {
        outcome.cancelled = true;
        outcome.message = "cancelled";
    } else if (stalled) {
        outcome.stalled = true;
        outcome.message = "stalled: no data for " +
            std::to_string(std::chrono::duration_cast<std::chrono::seconds>(m_options.stallTimeout).count()) + "s";
    } else if (timedOut) {
        outcome.timedOut = true;
        outcome.message = "exceeded overall deadline";
    } else if (writeFailed || !out) {
        outcome.message = "failed writing " + partPath.string();
    } else {
        outcome.transient = response.transient;
        outcome.message = response.error.empty() ? "transfer failed" : response.error;
    }
    return outcome;
}

void ResilientFetcher::probeSources(const std::string& probeAsset, const CancellationToken& token) {
    std::vector<std::future<void>> probes;
    for (const auto& source : m_ranker.snapshot()) {
        std::string base = source.baseUrl;
        probes.push_back(std::async(std::launch::async, [this, base, probeAsset, token] {
            HttpRequest request;
            request.url = joinUrl(base, probeAsset);
            request.timeout = std::chrono::seconds(15);
            request.connectTimeout = std::chrono::seconds(10);

            const auto start = Clock::now();
            Clock::time_point firstByte{};
            uint64_t bytes = 0;
            HttpResult response = m_transport.get(request, [&](const char*, size_t size) {
                if (bytes == 0) firstByte = Clock::now();
                bytes += size;
                return true;
            }, token);

            if (!response.ok || bytes == 0) {
                Console::debug("Probe of ", base, " failed: ", response.error);
                m_ranker.recordUnreachable(base);
                return;
            }
            auto total = std::chrono::duration<double>(Clock::now() - start).count();
            auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(firstByte - start).count();
            double speed = (bytes / 1024.0) / std::max(total, 0.001);
            Console::debug("Probe of ", base, ": ", latency, " ms, ", speed, " KB/s");
            m_ranker.recordMeasurement(base, latency, speed);
        }));
    }
    for (auto& probe : probes) probe.get();
}

} // namespace PakForge
