// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <subplay/Config.hpp>

#include <memory>
#include <string>
#include <vector>

namespace subplay
{

/// @brief Main application orchestrator: plays the playlist and shows subtitles as they appear.
class App
{
  public:
    /// @param config The application configuration.
    /// @param inputs Audio files and directories to play.
    App(AppConfig config, std::vector<std::string> inputs);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// @brief Builds the playlist, loads the whisper models and prepares the terminal.
    /// @return Success or an error.
    [[nodiscard]] auto initialize() -> VoidResult;

    /// @brief Plays the playlist until it ends or the user quits.
    /// @return Exit code (0 for success).
    [[nodiscard]] auto run() -> int;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace subplay
