#include <catch2/catch.hpp>
#include "hfpull/url_classifier.hpp"
#include <variant>

using hfpull::DownloadTarget;
using hfpull::RepositoryReference;
using hfpull::UnrecognizedTarget;

TEST_CASE("tree URL becomes a repository reference") {
    hfpull::UrlClassifier classifier;
    auto result = classifier.classify("https://huggingface.co/org/model/tree/main/sub/dir");
    auto* ref = std::get_if<RepositoryReference>(&result);
    REQUIRE(ref != nullptr);
    REQUIRE(ref->owner == "org");
    REQUIRE(ref->repoName == "model");
    REQUIRE(ref->branch == "main");
    REQUIRE(ref->subpath == "sub/dir");
}

TEST_CASE("tree URL without subpath points at the repository root") {
    hfpull::UrlClassifier classifier;
    auto result = classifier.classify("https://hf-mirror.com/org/model/tree/v1.0/");
    auto* ref = std::get_if<RepositoryReference>(&result);
    REQUIRE(ref != nullptr);
    REQUIRE(ref->branch == "v1.0");
    REQUIRE(ref->subpath.empty());
}

TEST_CASE("trailing slashes are stripped from the subpath") {
    hfpull::UrlClassifier classifier;
    auto result = classifier.classify("https://hf-mirror.com/org/model/tree/main/onnx//");
    auto* ref = std::get_if<RepositoryReference>(&result);
    REQUIRE(ref != nullptr);
    REQUIRE(ref->subpath == "onnx");
}

TEST_CASE("blob URL is rewritten to a resolve URL on the canonical host") {
    hfpull::UrlClassifier classifier;
    auto result = classifier.classify("https://huggingface.co/org/model/blob/main/weights/model.safetensors");
    auto* target = std::get_if<DownloadTarget>(&result);
    REQUIRE(target != nullptr);
    REQUIRE(target->url == "https://hf-mirror.com/org/model/resolve/main/weights/model.safetensors");
    REQUIRE(target->filename == "model.safetensors");
}

TEST_CASE("resolve URL keeps its path and decodes the file name") {
    hfpull::UrlClassifier classifier;
    auto result = classifier.classify("https://hf-mirror.com/org/model/resolve/main/my%20file.bin?download=true");
    auto* target = std::get_if<DownloadTarget>(&result);
    REQUIRE(target != nullptr);
    REQUIRE(target->url == "https://hf-mirror.com/org/model/resolve/main/my%20file.bin");
    REQUIRE(target->filename == "my file.bin");
}

TEST_CASE("foreign URLs are downloaded as they are") {
    hfpull::UrlClassifier classifier;
    auto result = classifier.classify("https://example.com/files/archive.tar.gz");
    auto* target = std::get_if<DownloadTarget>(&result);
    REQUIRE(target != nullptr);
    REQUIRE(target->url == "https://example.com/files/archive.tar.gz");
    REQUIRE(target->filename == "archive.tar.gz");
}

TEST_CASE("foreign URL without a file name gets the default name") {
    hfpull::UrlClassifier classifier;
    auto result = classifier.classify("https://example.com/");
    auto* target = std::get_if<DownloadTarget>(&result);
    REQUIRE(target != nullptr);
    REQUIRE(target->filename == hfpull::DEFAULT_FILENAME);
}

TEST_CASE("encoded separators never reach the file name") {
    hfpull::UrlClassifier classifier;
    auto nameOf = [&](const std::string& url) {
        auto result = classifier.classify(url);
        auto* target = std::get_if<DownloadTarget>(&result);
        REQUIRE(target != nullptr);
        return target->filename;
    };
    REQUIRE(nameOf("https://example.com/files/..%2Fescaped.bin") == "escaped.bin");
    REQUIRE(nameOf("https://example.com/%2Fetc%2Fx") == "x");
    REQUIRE(nameOf("https://example.com/files/%2E%2E") == hfpull::DEFAULT_FILENAME);
    REQUIRE(nameOf("https://example.com/files/dir%2F") == hfpull::DEFAULT_FILENAME);
    REQUIRE(nameOf("https://hf-mirror.com/org/model/resolve/main/sub%2F..%2F..%2Fw.bin") == "w.bin");
}

TEST_CASE("known host URL that is neither tree nor file is a direct download") {
    hfpull::UrlClassifier classifier;
    auto result = classifier.classify("https://huggingface.co/org/model");
    auto* target = std::get_if<DownloadTarget>(&result);
    REQUIRE(target != nullptr);
    REQUIRE(target->url == "https://huggingface.co/org/model");
    REQUIRE(target->filename == "model");
}

TEST_CASE("scheme-less address is accepted for known hosts only") {
    hfpull::UrlClassifier classifier;
    auto known = classifier.classify("hf-mirror.com/org/model/tree/main");
    REQUIRE(std::holds_alternative<RepositoryReference>(known));

    auto unknown = classifier.classify("example.com/file.bin");
    REQUIRE(std::holds_alternative<UnrecognizedTarget>(unknown));
}

TEST_CASE("empty and non-http addresses are unrecognized") {
    hfpull::UrlClassifier classifier;
    REQUIRE(std::holds_alternative<UnrecognizedTarget>(classifier.classify("")));
    REQUIRE(std::holds_alternative<UnrecognizedTarget>(classifier.classify("   ")));
    REQUIRE(std::holds_alternative<UnrecognizedTarget>(classifier.classify("ftp://example.com/a.bin")));
    REQUIRE(std::holds_alternative<UnrecognizedTarget>(classifier.classify("https:///a.bin")));
}

TEST_CASE("custom endpoint becomes the canonical host and is recognised") {
    hfpull::UrlClassifier classifier("https://models.internal.example/", {"mirror.example.org"});
    REQUIRE(classifier.endpoint() == "https://models.internal.example");

    auto fromHub = classifier.classify("https://huggingface.co/org/model/resolve/main/a.bin");
    auto* target = std::get_if<DownloadTarget>(&fromHub);
    REQUIRE(target != nullptr);
    REQUIRE(target->url == "https://models.internal.example/org/model/resolve/main/a.bin");

    auto fromMirror = classifier.classify("https://mirror.example.org/org/model/tree/main");
    REQUIRE(std::holds_alternative<RepositoryReference>(fromMirror));

    auto fromSelf = classifier.classify("https://models.internal.example/org/model/tree/dev/x");
    REQUIRE(std::holds_alternative<RepositoryReference>(fromSelf));
}

TEST_CASE("host matching ignores case and port") {
    hfpull::UrlClassifier classifier;
    auto result = classifier.classify("https://HuggingFace.co:443/org/model/tree/main");
    REQUIRE(std::holds_alternative<RepositoryReference>(result));
}

TEST_CASE("percentDecode keeps malformed escapes") {
    REQUIRE(hfpull::percentDecode("a%20b") == "a b");
    REQUIRE(hfpull::percentDecode("100%") == "100%");
    REQUIRE(hfpull::percentDecode("%zz") == "%zz");
    REQUIRE(hfpull::percentDecode("%41") == "A");
}

TEST_CASE("repositoryUrl builds a browsable tree URL") {
    RepositoryReference ref{"org", "model", "main", "onnx"};
    REQUIRE(hfpull::repositoryUrl(ref, "https://hf-mirror.com") ==
            "https://hf-mirror.com/org/model/tree/main/onnx");
    ref.subpath.clear();
    REQUIRE(hfpull::repositoryUrl(ref, "https://hf-mirror.com") ==
            "https://hf-mirror.com/org/model/tree/main");
}
