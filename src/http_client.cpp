#include "http_client.hpp"
#include <curl/curl.h>

namespace PakForge {

bool isTransientStatus(long statusCode) {
    return statusCode == 408 || statusCode == 429 || statusCode == 500 ||
           statusCode == 502 || statusCode == 503 || statusCode == 504;
}

static bool isTransientCurlError(CURLcode code) {
    return code == CURLE_OPERATION_TIMEDOUT || code == CURLE_COULDNT_CONNECT ||
           code == CURLE_COULDNT_RESOLVE_HOST || code == CURLE_GOT_NOTHING ||
           code == CURLE_RECV_ERROR || code == CURLE_SEND_ERROR ||
           code == CURLE_PARTIAL_FILE;
}

namespace {

struct TransferContext {
    const ChunkHandler* onChunk;
    const CancellationToken* token;
    bool handlerStopped = false;
};

} // namespace

static size_t WriteChunkCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* ctx = static_cast<TransferContext*>(userp);
    size_t bytes = size * nmemb;
    if (ctx->token->isCancelled()) return 0;
    if (!(*ctx->onChunk)(static_cast<const char*>(contents), bytes)) {
        ctx->handlerStopped = true;
        return 0;
    }
    return bytes;
}

static int CancelProgressCallback(void* clientp, curl_off_t /*dltotal*/, curl_off_t /*dlnow*/,
                                  curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) {
    auto* ctx = static_cast<TransferContext*>(clientp);
    return ctx->token->isCancelled() ? 1 : 0;
}

CurlTransport::CurlTransport() {
    curl_global_init(CURL_GLOBAL_ALL);
}

CurlTransport::~CurlTransport() {
    curl_global_cleanup();
}

HttpResult CurlTransport::get(const HttpRequest& request, const ChunkHandler& onChunk,
                              const CancellationToken& token) {
    HttpResult result;
    CURL* curl = curl_easy_init();
    if (!curl) {
        result.error = "curl_easy_init failed";
        return result;
    }

    TransferContext ctx{&onChunk, &token};

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteChunkCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "PakForge/1.0");
    curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, CancelProgressCallback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(request.connectTimeout.count()));
    if (request.timeout.count() > 0) {
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
    }

    CURLcode res = curl_easy_perform(curl);
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &result.statusCode);
    curl_easy_cleanup(curl);

    if (res == CURLE_OK) {
        result.ok = true;
        return result;
    }

    if (res == CURLE_ABORTED_BY_CALLBACK || (res == CURLE_WRITE_ERROR &&
        (ctx.handlerStopped || token.isCancelled()))) {
        result.aborted = true;
        result.error = "transfer aborted";
        return result;
    }

    if (res == CURLE_HTTP_RETURNED_ERROR) {
        result.transient = isTransientStatus(result.statusCode);
        result.error = "HTTP " + std::to_string(result.statusCode);
        return result;
    }

    result.transient = isTransientCurlError(res);
    result.error = curl_easy_strerror(res);
    return result;
}

} // namespace PakForge
