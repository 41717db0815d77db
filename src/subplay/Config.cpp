// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace subplay
{

namespace
{

    constexpr auto DefaultPreviewModelFilename = std::string_view { "ggml-tiny.bin" };
    constexpr auto DefaultFullModelFilename = std::string_view { "ggml-base.bin" };

    auto tierPolicyToString(TierPolicy policy) -> std::string_view
    {
        return policy == TierPolicy::Fixed ? "fixed" : "adaptive";
    }

    auto configError(std::string message) -> std::unexpected<Error>
    {
        return makeError(ErrorCode::ConfigError, std::move(message));
    }

} // namespace

auto defaultConfigDir() -> std::string
{
#if defined(__APPLE__)
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/Library/Application Support/subplay";
    return ".";
#else
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && *xdgConfig)
        return std::string(xdgConfig) + "/subplay";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/subplay";
    return ".";
#endif
}

auto defaultDataDir() -> std::string
{
#if defined(__APPLE__)
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/Library/Application Support/subplay";
    return ".";
#else
    auto const* const xdgData = std::getenv("XDG_DATA_HOME");
    if (xdgData && *xdgData)
        return std::string(xdgData) + "/subplay";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.local/share/subplay";
    return ".";
#endif
}

auto defaultModelDir() -> std::string
{
    return defaultDataDir() + "/models";
}

auto defaultPreviewModelPath() -> std::string
{
    return defaultModelDir() + "/" + std::string(DefaultPreviewModelFilename);
}

auto defaultFullModelPath() -> std::string
{
    return defaultModelDir() + "/" + std::string(DefaultFullModelFilename);
}

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto parseConfig(std::string_view content) -> Result<AppConfig>
{
    auto parseResult = json::parse(content);
    if (!parseResult)
        return std::unexpected(parseResult.error());

    auto const& root = *parseResult;
    if (!root.is_object())
        return configError("Config root must be a JSON object");

    auto config = AppConfig {};

    // Scheduler section
    {
        auto const scheduler = json::section(root, "scheduler");
        auto& s = config.scheduler;
        s.previewSeconds = json::getDoubleOr(scheduler, "previewSeconds", s.previewSeconds);
        s.leadSeconds = json::getDoubleOr(scheduler, "leadSeconds", s.leadSeconds);
        s.upgradeStartAfterSeconds =
            json::getDoubleOr(scheduler, "upgradeStartAfterSeconds", s.upgradeStartAfterSeconds);
        s.fullChunkSeconds = json::getDoubleOr(scheduler, "fullChunkSeconds", s.fullChunkSeconds);
        s.minRetryBackoffSeconds = json::getDoubleOr(scheduler, "minRetryBackoffSeconds", s.minRetryBackoffSeconds);
        s.maxRetryBackoffSeconds = json::getDoubleOr(scheduler, "maxRetryBackoffSeconds", s.maxRetryBackoffSeconds);

        auto const policy = json::getStringOr(scheduler, "tierPolicy", "adaptive");
        if (policy == "adaptive")
            s.tierPolicy = TierPolicy::Adaptive;
        else if (policy == "fixed")
            s.tierPolicy = TierPolicy::Fixed;
        else
            return configError(std::format("Unknown tierPolicy '{}'", policy));

        auto const fixedTier = json::getStringOr(scheduler, "fixedTier", tierToString(s.fixedTier));
        auto const tier = tierFromString(fixedTier);
        if (!tier)
            return configError(std::format("Unknown fixedTier '{}'", fixedTier));
        s.fixedTier = *tier;

        s.enableFullTranscription =
            json::getBoolOr(scheduler, "enableFullTranscription", s.enableFullTranscription);
        s.autoTranscribeOnPlay = json::getBoolOr(scheduler, "autoTranscribeOnPlay", s.autoTranscribeOnPlay);
        s.serializeAcrossTracks = json::getBoolOr(scheduler, "serializeAcrossTracks", s.serializeAcrossTracks);
        s.tickIntervalMs = json::getIntOr(scheduler, "tickIntervalMs", s.tickIntervalMs);
    }

    // Whisper section
    {
        auto const whisper = json::section(root, "whisper");
        auto& w = config.whisper;
        w.previewModelPath = json::getStringOr(whisper, "previewModelPath", "");
        w.fullModelPath = json::getStringOr(whisper, "fullModelPath", "");
        w.language = json::getStringOr(whisper, "language", w.language);
        w.device = json::getStringOr(whisper, "device", w.device);
        w.threads = json::getIntOr(whisper, "threads", w.threads);
        w.beamSize = json::getIntOr(whisper, "beamSize", w.beamSize);
        w.bestOf = json::getIntOr(whisper, "bestOf", w.bestOf);
        w.upgradeOnCpu = json::getBoolOr(whisper, "upgradeOnCpu", w.upgradeOnCpu);
    }

    // Player section
    {
        auto const player = json::section(root, "player");
        auto& p = config.player;
        p.supportedFormats = json::getStringListOr(player, "supportedFormats", p.supportedFormats);
        p.volume = json::getDoubleOr(player, "volume", p.volume);
        p.writeSrtOnComplete = json::getBoolOr(player, "writeSrtOnComplete", p.writeSrtOnComplete);
        p.loadExistingSrt = json::getBoolOr(player, "loadExistingSrt", p.loadExistingSrt);
    }

    config.logLevel = json::getStringOr(json::section(root, "log"), "level", config.logLevel);

    if (auto valid = validateConfig(config); !valid)
        return std::unexpected(valid.error());

    return config;
}

auto validateConfig(const AppConfig& config) -> VoidResult
{
    auto const& s = config.scheduler;
    if (s.previewSeconds <= 0.0 || s.fullChunkSeconds <= 0.0)
        return configError("Segment lengths must be positive");
    if (s.leadSeconds <= 0.0)
        return configError("leadSeconds must be positive");
    if (s.upgradeStartAfterSeconds < 0.0)
        return configError("upgradeStartAfterSeconds must not be negative");
    if (s.minRetryBackoffSeconds < 0.0 || s.maxRetryBackoffSeconds < s.minRetryBackoffSeconds)
        return configError("Retry backoff must satisfy 0 <= minRetryBackoffSeconds <= maxRetryBackoffSeconds");
    if (s.tickIntervalMs <= 0)
        return configError("tickIntervalMs must be positive");

    auto const& w = config.whisper;
    if (w.device != "auto" && w.device != "gpu" && w.device != "cpu")
        return configError(std::format("Unknown device '{}'", w.device));
    if (w.threads <= 0 || w.beamSize <= 0 || w.bestOf <= 0)
        return configError("threads, beamSize and bestOf must be positive");

    if (config.player.volume < 0.0 || config.player.volume > 1.0)
        return configError("volume must be between 0.0 and 1.0");

    if (!log::levelFromString(config.logLevel))
        return configError(std::format("Unknown log level '{}'", config.logLevel));

    return {};
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return configError(std::format("Cannot open config file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();

    auto config = parseConfig(ss.str());
    if (!config)
        return makeError(ErrorCode::ConfigError, std::format("{}: {}", path, config.error().message));
    return config;
}

auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult
{
    auto root = nlohmann::json::object();

    auto const& s = config.scheduler;
    root["scheduler"] = {
        { "previewSeconds", s.previewSeconds },
        { "leadSeconds", s.leadSeconds },
        { "upgradeStartAfterSeconds", s.upgradeStartAfterSeconds },
        { "fullChunkSeconds", s.fullChunkSeconds },
        { "minRetryBackoffSeconds", s.minRetryBackoffSeconds },
        { "maxRetryBackoffSeconds", s.maxRetryBackoffSeconds },
        { "tierPolicy", std::string(tierPolicyToString(s.tierPolicy)) },
        { "fixedTier", std::string(tierToString(s.fixedTier)) },
        { "enableFullTranscription", s.enableFullTranscription },
        { "autoTranscribeOnPlay", s.autoTranscribeOnPlay },
        { "serializeAcrossTracks", s.serializeAcrossTracks },
        { "tickIntervalMs", s.tickIntervalMs },
    };

    auto whisper = nlohmann::json::object();
    if (!config.whisper.previewModelPath.empty())
        whisper["previewModelPath"] = config.whisper.previewModelPath;
    if (!config.whisper.fullModelPath.empty())
        whisper["fullModelPath"] = config.whisper.fullModelPath;
    whisper["language"] = config.whisper.language;
    whisper["device"] = config.whisper.device;
    whisper["threads"] = config.whisper.threads;
    whisper["beamSize"] = config.whisper.beamSize;
    whisper["bestOf"] = config.whisper.bestOf;
    whisper["upgradeOnCpu"] = config.whisper.upgradeOnCpu;
    root["whisper"] = std::move(whisper);

    root["player"] = {
        { "supportedFormats", config.player.supportedFormats },
        { "volume", config.player.volume },
        { "writeSrtOnComplete", config.player.writeSrtOnComplete },
        { "loadExistingSrt", config.player.loadExistingSrt },
    };

    root["log"] = { { "level", config.logLevel } };

    // Create parent directory if needed
    auto const dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return configError(
                std::format("Failed to create config directory '{}': {}", dir.string(), ec.message()));
    }

    auto file = std::ofstream(std::string(path));
    if (!file.is_open())
        return configError(std::format("Cannot write config file: {}", path));

    file << root.dump(4) << '\n';
    return {};
}

auto loadConfig() -> Result<AppConfig>
{
    auto const path = defaultConfigPath();
    if (!std::filesystem::exists(path))
    {
        log::info("No config file found at {}, using defaults", path);
        return AppConfig {};
    }

    return loadConfigFromFile(path);
}

auto toSchedulerConfig(const AppConfig& config) -> SchedulerConfig
{
    auto const& s = config.scheduler;
    auto result = SchedulerConfig {};
    result.planner = PlannerPolicy {
        .previewSeconds = s.previewSeconds,
        .leadSeconds = s.leadSeconds,
        .upgradeStartAfterSeconds = s.upgradeStartAfterSeconds,
        .fullChunkSeconds = s.fullChunkSeconds,
        .minRetryBackoffSeconds = s.minRetryBackoffSeconds,
        .maxRetryBackoffSeconds = s.maxRetryBackoffSeconds,
        .tierPolicy = s.tierPolicy,
        .fixedTier = s.fixedTier,
        .enableFullTranscription = s.enableFullTranscription,
    };
    result.worker = WorkerConfig {
        .language = config.whisper.language,
        .serializeAcrossTracks = s.serializeAcrossTracks,
    };
    result.autoTranscribeOnPlay = s.autoTranscribeOnPlay;
    return result;
}

} // namespace subplay
