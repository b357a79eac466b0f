#include <catch2/catch.hpp>
#include "fake_http_client.hpp"
#include "temp_dir.hpp"
#include "hfpull/downloader.hpp"
#include "hfpull/errors.hpp"
#include "hfpull/task_runner.hpp"
#include <stdexcept>
#include <variant>

namespace {

hfpull::TransferConfig fastTransfer() {
    hfpull::TransferConfig transfer;
    transfer.progressIntervalMs = 0;
    transfer.pausePollMs = 10;
    return transfer;
}

} // namespace

TEST_CASE("downloader resolves hub links and saves under the chosen name") {
    TempDir dir;
    FakeHttpClient http;
    const std::string body = makePayload(7000);
    http.addFile("https://hf-mirror.com/org/model/resolve/main/weights.bin", body);

    hfpull::Downloader downloader(http, hfpull::NetworkConfig{}, fastTransfer());
    auto target = downloader.classify("https://huggingface.co/org/model/blob/main/weights.bin");
    auto* file = std::get_if<hfpull::DownloadTarget>(&target);
    REQUIRE(file != nullptr);

    auto outcome = downloader.downloadFile(*file, dir.path(), "renamed.bin",
                                           std::make_shared<hfpull::TransferState>());
    REQUIRE(outcome == hfpull::TransferOutcome::Completed);
    REQUIRE(readFile(dir / "renamed.bin") == body);
    REQUIRE_FALSE(std::filesystem::exists(dir / "weights.bin"));
}

TEST_CASE("encoded traversal in a URL stays inside the save directory") {
    TempDir dir;
    FakeHttpClient http;
    const std::string url = "https://example.com/files/..%2Fescaped.bin";
    http.addFile(url, makePayload(300));

    hfpull::Downloader downloader(http, hfpull::NetworkConfig{}, fastTransfer());
    auto target = downloader.classify(url);
    auto* file = std::get_if<hfpull::DownloadTarget>(&target);
    REQUIRE(file != nullptr);

    auto saveDir = dir / "save";
    auto outcome = downloader.downloadFile(*file, saveDir, "",
                                           std::make_shared<hfpull::TransferState>());
    REQUIRE(outcome == hfpull::TransferOutcome::Completed);
    REQUIRE(std::filesystem::exists(saveDir / "escaped.bin"));
    REQUIRE_FALSE(std::filesystem::exists(dir / "escaped.bin"));
}

TEST_CASE("override names leaving the save directory are refused") {
    TempDir dir;
    FakeHttpClient http;
    const std::string url = "https://example.com/files/a.bin";
    http.addFile(url, makePayload(300));

    hfpull::Downloader downloader(http, hfpull::NetworkConfig{}, fastTransfer());
    hfpull::DownloadTarget target{url, "a.bin"};
    auto saveDir = dir / "save";

    for (const std::string name : {"../x", "/tmp/x", "sub/../../x", "."}) {
        REQUIRE_THROWS_AS(downloader.downloadFile(target, saveDir, name,
                                                  std::make_shared<hfpull::TransferState>()),
                          hfpull::TransferError);
    }
    REQUIRE_FALSE(std::filesystem::exists(dir / "x"));
    REQUIRE(http.count("STREAM") == 0);
}

TEST_CASE("downloader lists through the configured endpoint") {
    FakeHttpClient http;
    http.addFile("https://hub.example.org/api/models/org/model/tree/main",
                 R"([{"type": "file", "path": "a.bin", "size": 3}])");

    hfpull::NetworkConfig network;
    network.endpoint = "https://hub.example.org";
    hfpull::Downloader downloader(http, network, fastTransfer());
    REQUIRE(downloader.endpoint() == "https://hub.example.org");

    auto target = downloader.classify("https://hub.example.org/org/model/tree/main");
    auto* ref = std::get_if<hfpull::RepositoryReference>(&target);
    REQUIRE(ref != nullptr);

    auto files = downloader.listFiles(*ref);
    REQUIRE(files.size() == 1);
    REQUIRE(files[0].downloadUrl == "https://hub.example.org/org/model/resolve/main/a.bin");
}

TEST_CASE("batch from the downloader runs on a background task") {
    TempDir dir;
    FakeHttpClient http;
    http.addFile("https://hf-mirror.com/org/model/resolve/main/x/a.bin", makePayload(10));
    http.addFile("https://hf-mirror.com/org/model/resolve/main/x/b.bin", makePayload(20));

    hfpull::Downloader downloader(http, hfpull::NetworkConfig{}, fastTransfer());
    std::vector<hfpull::RemoteFileEntry> entries = {
        {"x/a.bin", "https://hf-mirror.com/org/model/resolve/main/x/a.bin", 10},
        {"x/b.bin", "https://hf-mirror.com/org/model/resolve/main/x/b.bin", 20},
    };
    auto batch = downloader.makeBatch(dir.path());
    batch->selectAndQueue(entries, {0, 1});

    auto future = hfpull::TaskRunner::instance().async([&]() { return batch->run(); });
    REQUIRE(future.get() == hfpull::BatchOutcome::Completed);
    REQUIRE(std::filesystem::file_size(dir.path() / "x" / "b.bin") == 20);
}

TEST_CASE("task runner delivers results and exceptions through futures") {
    auto& runner = hfpull::TaskRunner::instance();
    auto sum = runner.async([](int a, int b) { return a + b; }, 2, 3);
    REQUIRE(sum.get() == 5);

    auto failing = runner.async([]() -> int { throw std::runtime_error("boom"); });
    REQUIRE_THROWS_AS(failing.get(), std::runtime_error);

    runner.shutdown();
    REQUIRE(runner.activeCount() == 0);
}

TEST_CASE("explicit save directory wins over configuration") {
    REQUIRE(hfpull::Downloader::resolveSaveDir("/srv/models") == std::filesystem::path("/srv/models"));
}
