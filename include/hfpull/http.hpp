#ifndef HFPULL_HTTP_HPP
#define HFPULL_HTTP_HPP

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace hfpull {

struct HttpResponse {
    long status = 0;
    std::optional<std::uint64_t> contentLength;
    std::string body;
};

struct StreamResult {
    long status = 0;
    // True when one of the handlers returned false and the transfer was
    // stopped on our side.
    bool aborted = false;
};

// Minimal HTTP surface needed by the lister and the transfer engine.
// Every method throws TransportError when no HTTP response could be obtained.
class HttpClient {
public:
    // Called once with the final status code before any body bytes.
    // Returning false abandons the request.
    using ResponseHandler = std::function<bool(long status)>;
    // Called for every block of body bytes. Returning false abandons the
    // request.
    using DataHandler = std::function<bool(const char* data, size_t size)>;

    virtual ~HttpClient() = default;

    virtual HttpResponse get(const std::string& url) = 0;
    // Metadata-only request; body is always empty.
    virtual HttpResponse head(const std::string& url, long timeoutSeconds) = 0;
    // Streaming GET. With rangeStart set, sends "Range: bytes=<start>-".
    virtual StreamResult stream(const std::string& url,
                                std::optional<std::uint64_t> rangeStart,
                                const ResponseHandler& onResponse,
                                const DataHandler& onData) = 0;
};

struct HttpOptions {
    std::string userAgent = "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36";
    long connectTimeoutSeconds = 30;
    // Applies to get(); streams are only bounded by readTimeoutSeconds.
    long requestTimeoutSeconds = 30;
    // A stream that receives nothing for this long fails.
    long readTimeoutSeconds = 30;
    // Upper bound for a single body block handed to a DataHandler.
    long bufferSize = 8192;
};

class CurlHttpClient : public HttpClient {
public:
    explicit CurlHttpClient(HttpOptions options = {});

    HttpResponse get(const std::string& url) override;
    HttpResponse head(const std::string& url, long timeoutSeconds) override;
    StreamResult stream(const std::string& url,
                        std::optional<std::uint64_t> rangeStart,
                        const ResponseHandler& onResponse,
                        const DataHandler& onData) override;

    const HttpOptions& options() const { return options_; }

private:
    HttpOptions options_;

    static size_t writeCallback(void* contents, size_t size, size_t nmemb, std::string* userp);
    static size_t streamWriteCallback(void* contents, size_t size, size_t nmemb, void* userp);
};

} // namespace hfpull

#endif // HFPULL_HTTP_HPP
