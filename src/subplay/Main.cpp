// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <subplay/App.hpp>
#include <subplay/Config.hpp>

#include <CLI/CLI.hpp>

#include <string>
#include <vector>

int main(int argc, char** argv)
{
    auto app = CLI::App { "subplay - audio player with on-the-fly subtitles" };

    auto inputs = std::vector<std::string> {};
    auto configPath = std::string {};
    auto previewModel = std::string {};
    auto fullModel = std::string {};
    auto language = std::string {};
    auto device = std::string {};
    auto leadSeconds = 0.0;
    auto verbose = false;

    app.add_option("inputs", inputs, "Audio files or directories to play")->required();
    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_option("--preview-model", previewModel, "Whisper model for fast preview subtitles");
    app.add_option("--full-model", fullModel, "Whisper model for full-quality subtitles");
    app.add_option("-l,--language", language, "Spoken language code, or \"auto\" to detect");
    app.add_option("--device", device, "Compute device (auto|gpu|cpu)")
        ->check(CLI::IsMember({ "auto", "gpu", "cpu" }));
    app.add_option("--lead", leadSeconds, "Seconds of subtitles to prepare ahead of playback")
        ->check(CLI::PositiveNumber);
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    CLI11_PARSE(app, argc, argv);

    // Load config
    auto configResult = configPath.empty() ? subplay::loadConfig() : subplay::loadConfigFromFile(configPath);

    if (!configResult)
    {
        subplay::log::error("Failed to load config: {}", configResult.error());
        return 1;
    }

    auto& config = *configResult;

    // Apply CLI overrides
    if (!previewModel.empty())
        config.whisper.previewModelPath = previewModel;
    if (!fullModel.empty())
        config.whisper.fullModelPath = fullModel;
    if (!language.empty())
        config.whisper.language = language;
    if (!device.empty())
        config.whisper.device = device;
    if (leadSeconds > 0.0)
        config.scheduler.leadSeconds = leadSeconds;

    subplay::log::setLevel(subplay::log::levelFromString(config.logLevel).value_or(subplay::log::Level::Info));
    if (verbose)
        subplay::log::setLevel(subplay::log::Level::Debug);

    auto application = subplay::App(std::move(config), std::move(inputs));
    auto initResult = application.initialize();
    if (!initResult)
    {
        subplay::log::error("Initialization failed: {}", initResult.error());
        return 1;
    }

    return application.run();
}
