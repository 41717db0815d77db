// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <termios.h>
#include <unistd.h>

namespace subplay
{

/// @brief A player command entered on the keyboard.
enum class ConsoleCommand : std::uint8_t
{
    TogglePause,
    Next,
    Previous,
    SeekForward,
    SeekBackward,
    Quit,
};

/// @brief Maps a key press to its command: space, n, p, f, b, q.
[[nodiscard]] auto commandForKey(char key) -> std::optional<ConsoleCommand>;

/// @brief Minimal terminal front end: raw keyboard input and a redrawn status line.
///
/// When stdin is not a terminal, raw mode is skipped and keys are still read line-buffered.
class Console
{
  public:
    /// @param fd Input to read keys from.
    explicit Console(int fd = STDIN_FILENO);
    ~Console();

    Console(Console const&) = delete;
    auto operator=(Console const&) -> Console& = delete;

    /// @brief Switches the terminal to raw mode (no echo, no line buffering).
    [[nodiscard]] auto initialize() -> VoidResult;

    /// @brief Restores the original terminal state.
    void shutdown();

    /// @brief Waits up to @p timeoutMs for a key press.
    ///
    /// Keys that arrive together are returned by successive calls. Once the input reaches end of
    /// file or hangs up it is no longer watched, and the call only waits out the timeout.
    /// @return The command of the first recognized key, if any.
    [[nodiscard]] auto pollCommand(int timeoutMs) -> std::optional<ConsoleCommand>;

    /// @brief Prints the "now playing" header of a track.
    void showTrack(std::string_view path, std::size_t index, std::size_t count, std::optional<Seconds> duration);

    /// @brief Redraws the status line: position, pause state and subtitle text.
    void showLine(Seconds position, bool paused, std::string_view text);

    /// @brief Ends the status line so following output starts on a fresh line.
    void finishLine();

  private:
    void stopWatching();

    int _fd;
    std::string _pending; // Read but not yet handled.
    struct termios _origTermios {};
    bool _rawMode = false;
    bool _lineOpen = false;
};

} // namespace subplay
