// SPDX-License-Identifier: Apache-2.0
#include <array>
#include <cstdio>
#include <filesystem>
#include <format>
#include <print>

#include <poll.h>
#include <unistd.h>

#include <core/Log.hpp>
#include <subplay/Console.hpp>
#include <subtitle/Srt.hpp>

namespace subplay
{

auto commandForKey(char key) -> std::optional<ConsoleCommand>
{
    switch (key)
    {
        case ' ': return ConsoleCommand::TogglePause;
        case 'n':
        case 'N': return ConsoleCommand::Next;
        case 'p':
        case 'P': return ConsoleCommand::Previous;
        case 'f':
        case 'F': return ConsoleCommand::SeekForward;
        case 'b':
        case 'B': return ConsoleCommand::SeekBackward;
        case 'q':
        case 'Q': return ConsoleCommand::Quit;
        default: return std::nullopt;
    }
}

Console::Console(int fd): _fd(fd)
{
}

Console::~Console()
{
    shutdown();
}

auto Console::initialize() -> VoidResult
{
    if (_fd < 0 || !isatty(_fd))
        return {};

    if (tcgetattr(_fd, &_origTermios) != 0)
        return makeError(ErrorCode::IoError, "Failed to query terminal attributes");

    auto raw = _origTermios;
    raw.c_lflag &= ~static_cast<tcflag_t>(ICANON | ECHO);
    raw.c_cc[VMIN] = 0;
    raw.c_cc[VTIME] = 0;
    if (tcsetattr(_fd, TCSAFLUSH, &raw) != 0)
        return makeError(ErrorCode::IoError, "Failed to enable raw terminal mode");

    _rawMode = true;
    return {};
}

void Console::shutdown()
{
    finishLine();
    if (_rawMode)
    {
        tcsetattr(_fd, TCSAFLUSH, &_origTermios);
        _rawMode = false;
    }
}

auto Console::pollCommand(int timeoutMs) -> std::optional<ConsoleCommand>
{
    while (!_pending.empty())
    {
        auto const key = _pending.front();
        _pending.erase(0, 1);
        if (auto command = commandForKey(key))
            return command;
    }

    if (_fd < 0)
    {
        ::poll(nullptr, 0, timeoutMs);
        return std::nullopt;
    }

    auto fds = std::array<struct pollfd, 1> {};
    fds[0] = { .fd = _fd, .events = POLLIN, .revents = 0 };

    if (::poll(fds.data(), 1, timeoutMs) <= 0)
        return std::nullopt;

    if ((fds[0].revents & POLLIN) == 0)
    {
        if ((fds[0].revents & (POLLHUP | POLLERR | POLLNVAL)) != 0)
        {
            stopWatching();
            ::poll(nullptr, 0, timeoutMs);
        }
        return std::nullopt;
    }

    auto buf = std::array<char, 64> {};
    auto const n = ::read(_fd, buf.data(), buf.size());
    if (n <= 0)
    {
        stopWatching();
        ::poll(nullptr, 0, timeoutMs);
        return std::nullopt;
    }

    _pending.append(buf.data(), static_cast<std::size_t>(n));
    return pollCommand(0);
}

void Console::stopWatching()
{
    if (_fd >= 0)
        log::debug("Keyboard input closed; playback continues without key commands");
    _fd = -1;
}

void Console::showTrack(std::string_view path,
                        std::size_t index,
                        std::size_t count,
                        std::optional<Seconds> duration)
{
    finishLine();
    auto const name = std::filesystem::path(path).filename().string();
    if (duration)
        std::println("[{}/{}] {} ({})", index + 1, count, name, srt::formatTimestamp(*duration));
    else
        std::println("[{}/{}] {}", index + 1, count, name);
    std::fflush(stdout);
}

void Console::showLine(Seconds position, bool paused, std::string_view text)
{
    // Carriage return + erase line, then redraw in place.
    std::print("\r\033[2K{} {} {}", srt::formatTimestamp(position), paused ? "||" : "> ", text);
    std::fflush(stdout);
    _lineOpen = true;
}

void Console::finishLine()
{
    if (!_lineOpen)
        return;
    std::print("\n");
    std::fflush(stdout);
    _lineOpen = false;
}

} // namespace subplay
