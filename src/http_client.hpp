#pragma once

#include "cancellation.hpp"
#include <chrono>
#include <cstddef>
#include <functional>
#include <string>

namespace PakForge {

struct HttpRequest {
    std::string url;
    std::chrono::milliseconds timeout{0};          // 0 = no overall limit
    std::chrono::milliseconds connectTimeout{30000};
};

struct HttpResult {
    bool ok = false;
    long statusCode = 0;
    bool aborted = false;       // stopped by the token or the chunk handler
    bool transient = false;     // worth retrying on the same source
    std::string error;
};

// Receives each chunk of the body; returning false aborts the transfer
using ChunkHandler = std::function<bool(const char* data, size_t size)>;

// Narrow streaming GET used by the fetcher so tests can replace the network
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual HttpResult get(const HttpRequest& request, const ChunkHandler& onChunk,
                           const CancellationToken& token) = 0;
};

bool isTransientStatus(long statusCode);

// libcurl implementation. The transfer is aborted from the progress
// callback as soon as the token is cancelled.
class CurlTransport : public HttpTransport {
public:
    CurlTransport();
    ~CurlTransport() override;

    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    HttpResult get(const HttpRequest& request, const ChunkHandler& onChunk,
                   const CancellationToken& token) override;
};

} // namespace PakForge
