#include <catch2/catch.hpp>
#include "fake_http_client.hpp"
#include "hfpull/errors.hpp"
#include "hfpull/repository_lister.hpp"

namespace {

const char* LISTING_URL = "https://hf-mirror.com/api/models/org/model/tree/main/onnx";

const char* LISTING_BODY = R"([
  {"type": "directory", "oid": "a1", "size": 0, "path": "onnx/quantized"},
  {"type": "file", "oid": "b2", "size": 1024, "path": "onnx/model.onnx"},
  {"type": "file", "oid": "c3", "size": 20, "path": "onnx/config.json"},
  {"type": "file", "oid": "d4", "path": "onnx/README.md"}
])";

hfpull::RepositoryReference onnxRef() {
    return hfpull::RepositoryReference{"org", "model", "main", "onnx"};
}

hfpull::ListErrorKind listErrorKind(hfpull::RepositoryLister& lister,
                                    const hfpull::RepositoryReference& ref) {
    try {
        lister.listFiles(ref);
    } catch (const hfpull::ListError& e) {
        return e.kind();
    }
    FAIL("listFiles did not throw");
    return hfpull::ListErrorKind::Malformed;
}

} // namespace

TEST_CASE("listingUrl follows the models tree API") {
    FakeHttpClient http;
    hfpull::RepositoryLister lister(http, "https://hf-mirror.com/");
    REQUIRE(lister.listingUrl(onnxRef()) == LISTING_URL);

    hfpull::RepositoryReference root{"org", "model", "main", ""};
    REQUIRE(lister.listingUrl(root) == "https://hf-mirror.com/api/models/org/model/tree/main");
}

TEST_CASE("listFiles keeps files in listing order and skips directories") {
    FakeHttpClient http;
    http.addFile(LISTING_URL, LISTING_BODY);
    hfpull::RepositoryLister lister(http);

    auto files = lister.listFiles(onnxRef());
    REQUIRE(files.size() == 3);
    REQUIRE(files[0].relativePath == "onnx/model.onnx");
    REQUIRE(files[0].sizeBytes == 1024);
    REQUIRE(files[0].downloadUrl == "https://hf-mirror.com/org/model/resolve/main/onnx/model.onnx");
    REQUIRE(files[1].relativePath == "onnx/config.json");
    REQUIRE(files[2].relativePath == "onnx/README.md");
    REQUIRE(files[2].sizeBytes == 0);
    REQUIRE(hfpull::totalSize(files) == 1044);
    REQUIRE(http.count("GET", LISTING_URL) == 1);
}

TEST_CASE("empty directory lists no files") {
    FakeHttpClient http;
    http.addFile(LISTING_URL, "[]");
    hfpull::RepositoryLister lister(http);
    REQUIRE(lister.listFiles(onnxRef()).empty());
}

TEST_CASE("missing repository is reported as not found") {
    FakeHttpClient http;
    hfpull::RepositoryLister lister(http);
    REQUIRE(listErrorKind(lister, onnxRef()) == hfpull::ListErrorKind::NotFound);

    try {
        lister.listFiles(onnxRef());
    } catch (const hfpull::ListError& e) {
        REQUIRE(e.httpStatus() == 404);
    }
}

TEST_CASE("server errors are reported as not found with their status") {
    FakeHttpClient http;
    FakeHttpClient::Resource res;
    res.status = 500;
    res.body = "oops";
    http.add(LISTING_URL, res);
    hfpull::RepositoryLister lister(http);
    REQUIRE(listErrorKind(lister, onnxRef()) == hfpull::ListErrorKind::NotFound);
}

TEST_CASE("unreachable server is a network error") {
    FakeHttpClient http;
    FakeHttpClient::Resource res;
    res.unreachable = true;
    http.add(LISTING_URL, res);
    hfpull::RepositoryLister lister(http);
    REQUIRE(listErrorKind(lister, onnxRef()) == hfpull::ListErrorKind::Network);
}

TEST_CASE("bodies that are not a listing are malformed") {
    FakeHttpClient http;
    hfpull::RepositoryLister lister(http);
    auto ref = onnxRef();

    REQUIRE_THROWS_AS(lister.parseListing(ref, "<html>rate limited</html>"), hfpull::ListError);
    REQUIRE_THROWS_AS(lister.parseListing(ref, R"({"error": "nope"})"), hfpull::ListError);
    REQUIRE_THROWS_AS(lister.parseListing(ref, R"([{"type": "file"}])"), hfpull::ListError);
    REQUIRE_THROWS_AS(lister.parseListing(ref, R"([{"type": "file", "path": "a", "size": "big"}])"),
                      hfpull::ListError);

    http.addFile(LISTING_URL, "not json");
    REQUIRE(listErrorKind(lister, ref) == hfpull::ListErrorKind::Malformed);
}

TEST_CASE("null size is treated as unknown") {
    FakeHttpClient http;
    hfpull::RepositoryLister lister(http);
    auto files = lister.parseListing(onnxRef(), R"([{"type": "file", "path": "onnx/a", "size": null}])");
    REQUIRE(files.size() == 1);
    REQUIRE(files[0].sizeBytes == 0);
}
