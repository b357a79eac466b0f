#include <catch2/catch.hpp>
#include "temp_dir.hpp"
#include "hfpull/config.hpp"
#include "hfpull/logger.hpp"
#include <cstdlib>
#include <nlohmann/json.hpp>

namespace {

void clearEnvironment() {
    ::unsetenv("HFPULL_ENDPOINT");
    ::unsetenv("HF_ENDPOINT");
    ::unsetenv("HFPULL_SAVE_DIR");
}

nlohmann::json readJson(const std::filesystem::path& path) {
    return nlohmann::json::parse(readFile(path));
}

} // namespace

TEST_CASE("missing config file is created with defaults") {
    clearEnvironment();
    TempDir dir;
    auto path = dir / "config.json";
    auto& cfg = hfpull::Config::instance();
    cfg.load(path);

    REQUIRE(std::filesystem::exists(path));
    REQUIRE(cfg.getNetwork().endpoint == "https://hf-mirror.com");
    REQUIRE(cfg.getTransfer().chunkSize == 8192);
    REQUIRE(cfg.getTransfer().progressIntervalMs == 500);
    REQUIRE(cfg.getNetwork().probeTimeout == 10);

    auto j = readJson(path);
    REQUIRE(j["network"]["endpoint"] == "https://hf-mirror.com");
    REQUIRE(j["general"]["log_level"] == "info");
    REQUIRE(j["transfer"]["pause_poll_ms"] == 100);
}

TEST_CASE("values from the file override defaults") {
    clearEnvironment();
    TempDir dir;
    auto path = dir / "config.json";
    writeFile(path, R"({
        "general": {"save_dir": "/data/models", "log_level": "debug"},
        "network": {"endpoint": "https://hub.example.org/", "mirrors": ["hub.example.org"], "read_timeout": 90},
        "transfer": {"chunk_size": 65536}
    })");

    auto& cfg = hfpull::Config::instance();
    cfg.load(path);
    REQUIRE(cfg.getGeneral().saveDir == "/data/models");
    REQUIRE(hfpull::parseLogLevel(cfg.getGeneral().logLevel) == hfpull::LogLevel::DEBUG);
    REQUIRE(cfg.getNetwork().endpoint == "https://hub.example.org");
    REQUIRE(cfg.getNetwork().mirrors == std::vector<std::string>{"hub.example.org"});
    REQUIRE(cfg.getNetwork().readTimeout == 90);
    REQUIRE(cfg.getNetwork().connectTimeout == 30);
    REQUIRE(cfg.getTransfer().chunkSize == 65536);
    REQUIRE(cfg.getTransfer().pausePollMs == 100);
}

TEST_CASE("unreadable config falls back to defaults") {
    clearEnvironment();
    TempDir dir;
    auto path = dir / "config.json";
    writeFile(path, R"({"transfer": {"chunk_size": 1024}, "network": )");

    auto& cfg = hfpull::Config::instance();
    cfg.load(path);
    REQUIRE(cfg.getTransfer().chunkSize == 8192);
    REQUIRE(cfg.getNetwork().endpoint == "https://hf-mirror.com");
}

TEST_CASE("environment overrides are applied but never saved") {
    clearEnvironment();
    TempDir dir;
    auto path = dir / "config.json";
    writeFile(path, R"({"network": {"endpoint": "https://hf-mirror.com"}})");

    ::setenv("HF_ENDPOINT", "https://fallback.example", 1);
    ::setenv("HFPULL_ENDPOINT", "https://primary.example/", 1);
    ::setenv("HFPULL_SAVE_DIR", "/tmp/hfpull-env", 1);

    auto& cfg = hfpull::Config::instance();
    cfg.load(path);
    REQUIRE(cfg.getNetwork().endpoint == "https://primary.example");
    REQUIRE(cfg.getGeneral().saveDir == "/tmp/hfpull-env");

    cfg.save();
    auto j = readJson(path);
    REQUIRE(j["network"]["endpoint"] == "https://hf-mirror.com");
    REQUIRE(j["general"]["save_dir"] == "");

    ::unsetenv("HFPULL_ENDPOINT");
    cfg.load(path);
    REQUIRE(cfg.getNetwork().endpoint == "https://fallback.example");

    clearEnvironment();
}

TEST_CASE("parseLogLevel understands common spellings") {
    REQUIRE(hfpull::parseLogLevel("DEBUG") == hfpull::LogLevel::DEBUG);
    REQUIRE(hfpull::parseLogLevel("warn") == hfpull::LogLevel::WARNING);
    REQUIRE(hfpull::parseLogLevel("Warning") == hfpull::LogLevel::WARNING);
    REQUIRE(hfpull::parseLogLevel("error") == hfpull::LogLevel::ERROR);
    REQUIRE(hfpull::parseLogLevel("chatty") == hfpull::LogLevel::INFO);
}
