#ifndef HFPULL_TESTS_FAKE_HTTP_CLIENT_HPP
#define HFPULL_TESTS_FAKE_HTTP_CLIENT_HPP

#include "hfpull/http.hpp"
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// In-memory HttpClient. URLs that were never added answer 404.
class FakeHttpClient : public hfpull::HttpClient {
public:
    struct Resource {
        std::string body;
        long status = 200;
        // Advertise Content-Length on HEAD.
        bool reportLength = true;
        // Answer "Range: bytes=N-" with 206; otherwise ignore the header and send 200.
        bool honorRange = true;
        // Every request throws TransportError.
        bool unreachable = false;
        // Only HEAD throws TransportError.
        bool headUnreachable = false;
        // Streams break with TransportError once this many body bytes went out.
        std::optional<size_t> failAfter;
    };

    struct Request {
        std::string method;
        std::string url;
        std::optional<std::uint64_t> rangeStart;
    };

    void add(const std::string& url, Resource resource);
    void addFile(const std::string& url, const std::string& body);
    // Mutable access to a resource added earlier.
    Resource& resource(const std::string& url);

    hfpull::HttpResponse get(const std::string& url) override;
    hfpull::HttpResponse head(const std::string& url, long timeoutSeconds) override;
    hfpull::StreamResult stream(const std::string& url,
                                std::optional<std::uint64_t> rangeStart,
                                const ResponseHandler& onResponse,
                                const DataHandler& onData) override;

    std::vector<Request> requests() const;
    size_t count(const std::string& method, const std::string& url = "") const;
    // Body bytes accepted by DataHandlers over all streams.
    std::uint64_t bytesServed() const;

    // Body bytes per DataHandler call.
    size_t blockSize = 4096;
    // Called before each block of a stream with the bytes already sent in it.
    std::function<void(size_t sent)> beforeBlock;

private:
    std::map<std::string, Resource> resources_;
    std::vector<Request> requests_;
    std::uint64_t bytesServed_ = 0;
    mutable std::mutex mutex_;

    void record(const std::string& method, const std::string& url,
                std::optional<std::uint64_t> rangeStart);
    std::optional<Resource> find(const std::string& url) const;
};

// Deterministic non-repeating-ish payload of the given size.
std::string makePayload(size_t size, unsigned seed = 7);

#endif // HFPULL_TESTS_FAKE_HTTP_CLIENT_HPP
