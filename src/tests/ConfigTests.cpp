// SPDX-License-Identifier: Apache-2.0
#include <subplay/Config.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>

using namespace subplay;

TEST_CASE("defaultConfigPath returns a path ending with config.json", "[config]")
{
    auto const path = defaultConfigPath();
    REQUIRE(path.ends_with("config.json"));
}

TEST_CASE("Default model paths live in the model directory", "[config]")
{
    CHECK(defaultPreviewModelPath().starts_with(defaultModelDir()));
    CHECK(defaultPreviewModelPath().ends_with("ggml-tiny.bin"));
    CHECK(defaultFullModelPath().ends_with("ggml-base.bin"));
}

TEST_CASE("defaultConfigDir honors XDG_CONFIG_HOME", "[config]")
{
    auto const* const previous = std::getenv("XDG_CONFIG_HOME");
    auto const saved = previous ? std::optional<std::string>(previous) : std::nullopt;

    ::setenv("XDG_CONFIG_HOME", "/tmp/subplay-xdg", 1);
    CHECK(defaultConfigDir() == "/tmp/subplay-xdg/subplay");
    CHECK(defaultConfigPath() == "/tmp/subplay-xdg/subplay/config.json");

    if (saved)
        ::setenv("XDG_CONFIG_HOME", saved->c_str(), 1);
    else
        ::unsetenv("XDG_CONFIG_HOME");
}

TEST_CASE("AppConfig has expected defaults", "[config]")
{
    auto const config = AppConfig {};
    CHECK(config.scheduler.previewSeconds == 20.0);
    CHECK(config.scheduler.leadSeconds == 12.0);
    CHECK(config.scheduler.upgradeStartAfterSeconds == 60.0);
    CHECK(config.scheduler.fullChunkSeconds == 45.0);
    CHECK(config.scheduler.tierPolicy == TierPolicy::Adaptive);
    CHECK(config.scheduler.enableFullTranscription);
    CHECK(config.whisper.language == "auto");
    CHECK(config.whisper.device == "auto");
    CHECK(config.player.supportedFormats == std::vector<std::string> { ".mp3", ".wav", ".flac" });
    CHECK(config.logLevel == "info");
    CHECK(validateConfig(config).has_value());
}

TEST_CASE("parseConfig reads every section", "[config]")
{
    auto const result = parseConfig(R"({
        "scheduler": {
            "previewSeconds": 15,
            "leadSeconds": 8.5,
            "upgradeStartAfterSeconds": 30,
            "fullChunkSeconds": 60,
            "minRetryBackoffSeconds": 2,
            "maxRetryBackoffSeconds": 20,
            "tierPolicy": "fixed",
            "fixedTier": "full",
            "enableFullTranscription": false,
            "autoTranscribeOnPlay": false,
            "serializeAcrossTracks": false,
            "tickIntervalMs": 100
        },
        "whisper": {
            "previewModelPath": "/models/tiny.bin",
            "fullModelPath": "/models/base.bin",
            "language": "de",
            "device": "cpu",
            "threads": 8,
            "beamSize": 5,
            "bestOf": 2,
            "upgradeOnCpu": true
        },
        "player": {
            "supportedFormats": [".ogg"],
            "volume": 0.5,
            "writeSrtOnComplete": true,
            "loadExistingSrt": false
        },
        "log": { "level": "debug" }
    })");
    REQUIRE(result.has_value());
    auto const& config = *result;

    SECTION("scheduler")
    {
        CHECK(config.scheduler.previewSeconds == 15.0);
        CHECK(config.scheduler.leadSeconds == 8.5);
        CHECK(config.scheduler.upgradeStartAfterSeconds == 30.0);
        CHECK(config.scheduler.fullChunkSeconds == 60.0);
        CHECK(config.scheduler.minRetryBackoffSeconds == 2.0);
        CHECK(config.scheduler.maxRetryBackoffSeconds == 20.0);
        CHECK(config.scheduler.tierPolicy == TierPolicy::Fixed);
        CHECK(config.scheduler.fixedTier == FidelityTier::Full);
        CHECK(!config.scheduler.enableFullTranscription);
        CHECK(!config.scheduler.autoTranscribeOnPlay);
        CHECK(!config.scheduler.serializeAcrossTracks);
        CHECK(config.scheduler.tickIntervalMs == 100);
    }

    SECTION("whisper")
    {
        CHECK(config.whisper.previewModelPath == "/models/tiny.bin");
        CHECK(config.whisper.fullModelPath == "/models/base.bin");
        CHECK(config.whisper.language == "de");
        CHECK(config.whisper.device == "cpu");
        CHECK(config.whisper.threads == 8);
        CHECK(config.whisper.beamSize == 5);
        CHECK(config.whisper.bestOf == 2);
        CHECK(config.whisper.upgradeOnCpu);
    }

    SECTION("player and log")
    {
        CHECK(config.player.supportedFormats == std::vector<std::string> { ".ogg" });
        CHECK(config.player.volume == 0.5);
        CHECK(config.player.writeSrtOnComplete);
        CHECK(!config.player.loadExistingSrt);
        CHECK(config.logLevel == "debug");
    }
}

TEST_CASE("parseConfig keeps defaults for missing keys", "[config]")
{
    auto const result = parseConfig(R"({ "scheduler": { "leadSeconds": 5 } })");
    REQUIRE(result.has_value());
    CHECK(result->scheduler.leadSeconds == 5.0);
    CHECK(result->scheduler.previewSeconds == 20.0);
    CHECK(result->whisper.threads == 4);
    CHECK(result->player.volume == 1.0);
}

TEST_CASE("parseConfig rejects invalid configurations", "[config]")
{
    auto const rejects = [](std::string_view content) {
        auto const result = parseConfig(content);
        return !result.has_value() && result.error().code == ErrorCode::ConfigError;
    };

    CHECK(rejects("{ not json"));
    CHECK(rejects("[1, 2, 3]"));
    CHECK(rejects(R"({ "scheduler": { "tierPolicy": "sometimes" } })"));
    CHECK(rejects(R"({ "scheduler": { "fixedTier": "ultra" } })"));
    CHECK(rejects(R"({ "scheduler": { "previewSeconds": 0 } })"));
    CHECK(rejects(R"({ "scheduler": { "leadSeconds": -1 } })"));
    CHECK(rejects(R"({ "scheduler": { "leadSeconds": 0 } })"));
    CHECK(rejects(R"({ "scheduler": { "upgradeStartAfterSeconds": -5 } })"));
    CHECK(rejects(R"({ "scheduler": { "minRetryBackoffSeconds": 30, "maxRetryBackoffSeconds": 10 } })"));
    CHECK(rejects(R"({ "scheduler": { "tickIntervalMs": 0 } })"));
    CHECK(rejects(R"({ "whisper": { "device": "tpu" } })"));
    CHECK(rejects(R"({ "whisper": { "threads": 0 } })"));
    CHECK(rejects(R"({ "player": { "volume": 1.5 } })"));
    CHECK(rejects(R"({ "log": { "level": "loud" } })"));
}

TEST_CASE("loadConfigFromFile reports a missing file", "[config]")
{
    auto const result = loadConfigFromFile("/nonexistent/subplay/config.json");
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConfigError);
}

TEST_CASE("loadConfigFromFile names the file in parse errors", "[config]")
{
    auto const tempPath = std::filesystem::temp_directory_path() / "subplay_test_bad_config.json";
    {
        auto file = std::ofstream(tempPath);
        file << R"({ "whisper": { "device": "tpu" } })";
    }

    auto const result = loadConfigFromFile(tempPath.string());
    REQUIRE(!result.has_value());
    CHECK(result.error().message.starts_with(tempPath.string()));

    std::filesystem::remove(tempPath);
}

TEST_CASE("saveConfigToFile writes a config that loads back", "[config]")
{
    auto const dir = std::filesystem::temp_directory_path() / "subplay_test_save";
    auto const path = dir / "nested" / "config.json";
    std::filesystem::remove_all(dir);

    auto config = AppConfig {};
    config.scheduler.leadSeconds = 7.5;
    config.scheduler.tierPolicy = TierPolicy::Fixed;
    config.scheduler.fixedTier = FidelityTier::Full;
    config.whisper.previewModelPath = "/models/tiny.bin";
    config.whisper.language = "fr";
    config.player.writeSrtOnComplete = true;
    config.logLevel = "warning";

    REQUIRE(saveConfigToFile(path.string(), config).has_value());
    REQUIRE(std::filesystem::exists(path));

    auto const loaded = loadConfigFromFile(path.string());
    REQUIRE(loaded.has_value());
    CHECK(loaded->scheduler.leadSeconds == 7.5);
    CHECK(loaded->scheduler.tierPolicy == TierPolicy::Fixed);
    CHECK(loaded->scheduler.fixedTier == FidelityTier::Full);
    CHECK(loaded->whisper.previewModelPath == "/models/tiny.bin");
    CHECK(loaded->whisper.fullModelPath.empty());
    CHECK(loaded->whisper.language == "fr");
    CHECK(loaded->player.writeSrtOnComplete);
    CHECK(loaded->logLevel == "warning");

    std::filesystem::remove_all(dir);
}

TEST_CASE("toSchedulerConfig maps the scheduler settings", "[config]")
{
    auto config = AppConfig {};
    config.scheduler.previewSeconds = 10.0;
    config.scheduler.leadSeconds = 4.0;
    config.scheduler.fullChunkSeconds = 30.0;
    config.scheduler.maxRetryBackoffSeconds = 90.0;
    config.scheduler.enableFullTranscription = false;
    config.scheduler.autoTranscribeOnPlay = false;
    config.scheduler.serializeAcrossTracks = false;
    config.whisper.language = "en";

    auto const result = toSchedulerConfig(config);
    CHECK(result.planner.previewSeconds == 10.0);
    CHECK(result.planner.leadSeconds == 4.0);
    CHECK(result.planner.fullChunkSeconds == 30.0);
    CHECK(result.planner.maxRetryBackoffSeconds == 90.0);
    CHECK(!result.planner.enableFullTranscription);
    CHECK(!result.autoTranscribeOnPlay);
    CHECK(result.worker.language == "en");
    CHECK(!result.worker.serializeAcrossTracks);
}
