#include "hfpull/http.hpp"
#include "hfpull/errors.hpp"
#include "hfpull/logger.hpp"
#include <curl/curl.h>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <utility>

namespace hfpull {

namespace {

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

void ensureCurlInitialized() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("Failed to initialize libcurl");
        }
        std::atexit([] { curl_global_cleanup(); });
    });
}

CurlHandle makeHandle(const HttpOptions& options, const std::string& url, char* errorBuffer) {
    ensureCurlInitialized();
    CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
    if (!curl) {
        throw TransportError("Failed to initialize cURL");
    }

    errorBuffer[0] = '\0';
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, options.userAgent.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, options.connectTimeoutSeconds);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, errorBuffer);
    return curl;
}

std::string describeFailure(CURLcode res, const char* errorBuffer) {
    std::string message = "cURL request failed: " + std::string(curl_easy_strerror(res));
    if (errorBuffer[0] != '\0') {
        message += " (" + std::string(errorBuffer) + ")";
    }
    return message;
}

std::optional<std::uint64_t> contentLengthOf(CURL* curl) {
    curl_off_t length = -1;
    if (curl_easy_getinfo(curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length) != CURLE_OK || length < 0) {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(length);
}

long responseCodeOf(CURL* curl) {
    long code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);
    return code;
}

struct StreamContext {
    CURL* curl = nullptr;
    const HttpClient::ResponseHandler* onResponse = nullptr;
    const HttpClient::DataHandler* onData = nullptr;
    bool responseSeen = false;
    bool aborted = false;
    long status = 0;

    bool announceResponse() {
        responseSeen = true;
        status = responseCodeOf(curl);
        if (*onResponse && !(*onResponse)(status)) {
            aborted = true;
        }
        return !aborted;
    }
};

} // namespace

CurlHttpClient::CurlHttpClient(HttpOptions options) : options_(std::move(options)) {}

size_t CurlHttpClient::writeCallback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    userp->append((char*)contents, size * nmemb);
    return size * nmemb;
}

HttpResponse CurlHttpClient::get(const std::string& url) {
    char errorBuffer[CURL_ERROR_SIZE];
    CurlHandle curl = makeHandle(options_, url, errorBuffer);

    HttpResponse response;
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, options_.requestTimeoutSeconds);

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        throw TransportError(describeFailure(res, errorBuffer));
    }

    response.status = responseCodeOf(curl.get());
    response.contentLength = contentLengthOf(curl.get());
    LOG_DEBUG("GET " + url + " -> " + std::to_string(response.status));
    return response;
}

HttpResponse CurlHttpClient::head(const std::string& url, long timeoutSeconds) {
    char errorBuffer[CURL_ERROR_SIZE];
    CurlHandle curl = makeHandle(options_, url, errorBuffer);

    curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, timeoutSeconds);

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        throw TransportError(describeFailure(res, errorBuffer));
    }

    HttpResponse response;
    response.status = responseCodeOf(curl.get());
    response.contentLength = contentLengthOf(curl.get());
    LOG_DEBUG("HEAD " + url + " -> " + std::to_string(response.status));
    return response;
}

size_t CurlHttpClient::streamWriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    StreamContext* ctx = static_cast<StreamContext*>(userp);
    size_t totalSize = size * nmemb;

    if (!ctx->responseSeen && !ctx->announceResponse()) {
        return 0;
    }
    if (*ctx->onData && !(*ctx->onData)(static_cast<const char*>(contents), totalSize)) {
        ctx->aborted = true;
        return 0;
    }
    return totalSize;
}

StreamResult CurlHttpClient::stream(const std::string& url,
                                    std::optional<std::uint64_t> rangeStart,
                                    const ResponseHandler& onResponse,
                                    const DataHandler& onData) {
    char errorBuffer[CURL_ERROR_SIZE];
    CurlHandle curl = makeHandle(options_, url, errorBuffer);

    StreamContext ctx;
    ctx.curl = curl.get();
    ctx.onResponse = &onResponse;
    ctx.onData = &onData;

    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, streamWriteCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(curl.get(), CURLOPT_BUFFERSIZE, options_.bufferSize);
    // No overall timeout: a stream may legitimately run for hours.
    curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_TIME, options_.readTimeoutSeconds);

    std::string range;
    if (rangeStart) {
        range = std::to_string(*rangeStart) + "-";
        curl_easy_setopt(curl.get(), CURLOPT_RANGE, range.c_str());
    }

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK && !ctx.aborted) {
        throw TransportError(describeFailure(res, errorBuffer));
    }

    // Empty bodies never reach the write callback.
    if (!ctx.responseSeen && !ctx.aborted) {
        ctx.announceResponse();
    }

    LOG_DEBUG("GET " + url + (range.empty() ? "" : " [" + range + "]") + " -> " +
              std::to_string(ctx.status) + (ctx.aborted ? " (stopped)" : ""));
    return StreamResult{ctx.status, ctx.aborted};
}

} // namespace hfpull
