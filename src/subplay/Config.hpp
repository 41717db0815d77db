// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <scheduler/SubtitleScheduler.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace subplay
{

/// @brief Scheduler configuration section.
struct ScheduleSettings
{
    Seconds previewSeconds = 20.0;
    Seconds leadSeconds = 12.0;
    Seconds upgradeStartAfterSeconds = 60.0;
    Seconds fullChunkSeconds = 45.0;
    Seconds minRetryBackoffSeconds = 5.0;
    Seconds maxRetryBackoffSeconds = 60.0;
    TierPolicy tierPolicy = TierPolicy::Adaptive;
    FidelityTier fixedTier = FidelityTier::Preview;
    bool enableFullTranscription = true;
    bool autoTranscribeOnPlay = true;
    bool serializeAcrossTracks = true;
    int tickIntervalMs = 200;
};

/// @brief Whisper configuration section.
struct WhisperSettings
{
    std::string previewModelPath;
    std::string fullModelPath;
    std::string language = "auto";
    std::string device = "auto"; ///< "auto", "gpu" or "cpu".
    int threads = 4;
    int beamSize = 1;
    int bestOf = 1;
    bool upgradeOnCpu = false;
};

/// @brief Player configuration section.
struct PlayerSettings
{
    std::vector<std::string> supportedFormats { ".mp3", ".wav", ".flac" };
    double volume = 1.0;
    bool writeSrtOnComplete = false;
    bool loadExistingSrt = true;
};

/// @brief Top-level application configuration.
struct AppConfig
{
    ScheduleSettings scheduler;
    WhisperSettings whisper;
    PlayerSettings player;
    std::string logLevel = "info";
};

/// @brief Loads the configuration from the default config path.
///
/// A missing file yields the defaults.
[[nodiscard]] auto loadConfig() -> Result<AppConfig>;

/// @brief Loads the configuration from a specific file path.
/// @return The loaded configuration, or a ConfigError if the file is missing, malformed or invalid.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Parses a configuration from JSON text. Missing keys keep their defaults.
[[nodiscard]] auto parseConfig(std::string_view content) -> Result<AppConfig>;

/// @brief Saves the full configuration to a file, creating its directory if needed.
[[nodiscard]] auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult;

/// @brief Checks value ranges and enumerations.
[[nodiscard]] auto validateConfig(const AppConfig& config) -> VoidResult;

/// @brief Builds the scheduler configuration from the application configuration.
[[nodiscard]] auto toSchedulerConfig(const AppConfig& config) -> SchedulerConfig;

/// @brief Returns the default config directory path.
/// On Linux: $XDG_CONFIG_HOME/subplay or ~/.config/subplay
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default config file path.
[[nodiscard]] auto defaultConfigPath() -> std::string;

/// @brief Returns the default data directory path.
/// On Linux: $XDG_DATA_HOME/subplay or ~/.local/share/subplay
[[nodiscard]] auto defaultDataDir() -> std::string;

/// @brief Returns the default whisper model directory path.
[[nodiscard]] auto defaultModelDir() -> std::string;

/// @brief Returns the default preview model path (a small, fast whisper model).
[[nodiscard]] auto defaultPreviewModelPath() -> std::string;

/// @brief Returns the default full model path.
[[nodiscard]] auto defaultFullModelPath() -> std::string;

} // namespace subplay
