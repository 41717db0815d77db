// SPDX-License-Identifier: Apache-2.0
#include "Srt.hpp"

#include <core/Log.hpp>

#include <charconv>
#include <cmath>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace subplay::srt
{

namespace
{

    auto trim(std::string_view text) -> std::string_view
    {
        auto const start = text.find_first_not_of(" \t\r\n");
        if (start == std::string_view::npos)
            return {};
        auto const end = text.find_last_not_of(" \t\r\n");
        return text.substr(start, end - start + 1);
    }

    auto parseInt(std::string_view text) -> std::optional<long long>
    {
        if (text.empty() || text.front() == '-')
            return std::nullopt;
        auto value = 0LL;
        auto const* const end = text.data() + text.size();
        auto const [ptr, ec] = std::from_chars(text.data(), end, value);
        if (ec != std::errc {} || ptr != end)
            return std::nullopt;
        return value;
    }

    auto splitLines(std::string_view text) -> std::vector<std::string_view>
    {
        auto lines = std::vector<std::string_view> {};
        while (!text.empty())
        {
            auto const nl = text.find('\n');
            lines.push_back(text.substr(0, nl));
            if (nl == std::string_view::npos)
                break;
            text.remove_prefix(nl + 1);
        }
        return lines;
    }

    /// @brief Parses one cue block (already split into non-empty, trimmed lines).
    auto parseBlock(const std::vector<std::string_view>& lines) -> Result<TextSpan>
    {
        if (lines.size() < 3)
            return makeError(ErrorCode::DecodeError, "Subtitle block has fewer than three lines");

        if (!parseInt(lines[0]))
            return makeError(ErrorCode::DecodeError, std::format("Invalid cue number: {}", lines[0]));

        auto const arrow = lines[1].find("-->");
        if (arrow == std::string_view::npos)
            return makeError(ErrorCode::DecodeError, std::format("Invalid time line: {}", lines[1]));

        auto const start = parseTime(trim(lines[1].substr(0, arrow)));
        if (!start)
            return std::unexpected(start.error());
        auto const end = parseTime(trim(lines[1].substr(arrow + 3)));
        if (!end)
            return std::unexpected(end.error());

        auto text = std::string {};
        for (auto i = std::size_t { 2 }; i < lines.size(); ++i)
        {
            if (!text.empty())
                text += ' ';
            text += lines[i];
        }

        return TextSpan { .start = *start, .end = *end, .text = std::move(text) };
    }

} // namespace

auto formatTime(Seconds seconds) -> std::string
{
    auto const totalMs = std::llround(std::max(seconds, 0.0) * 1000.0);
    auto const hours = totalMs / 3'600'000;
    auto const minutes = (totalMs / 60'000) % 60;
    auto const secs = (totalMs / 1000) % 60;
    auto const millis = totalMs % 1000;
    return std::format("{:02}:{:02}:{:02},{:03}", hours, minutes, secs, millis);
}

auto formatTimestamp(Seconds seconds) -> std::string
{
    auto const total = static_cast<long long>(std::max(seconds, 0.0));
    return std::format("{:02}:{:02}:{:02}", total / 3600, (total / 60) % 60, total % 60);
}

auto parseTime(std::string_view text) -> Result<Seconds>
{
    auto const invalid = [&] {
        return makeError(ErrorCode::DecodeError, std::format("Invalid SRT time: '{}'", text));
    };

    auto const firstColon = text.find(':');
    auto const secondColon = text.find(':', firstColon == std::string_view::npos ? 0 : firstColon + 1);
    auto const separator = text.find_first_of(",.", secondColon == std::string_view::npos ? 0 : secondColon);
    if (firstColon == std::string_view::npos || secondColon == std::string_view::npos
        || separator == std::string_view::npos)
        return invalid();

    auto const hours = parseInt(text.substr(0, firstColon));
    auto const minutes = parseInt(text.substr(firstColon + 1, secondColon - firstColon - 1));
    auto const secs = parseInt(text.substr(secondColon + 1, separator - secondColon - 1));
    auto const fraction = text.substr(separator + 1);
    auto const millis = parseInt(fraction);
    if (!hours || !minutes || !secs || !millis || *minutes >= 60 || *secs >= 60 || fraction.size() > 3)
        return invalid();

    // A short fraction is a decimal fraction: ",5" is half a second.
    auto scaledMillis = *millis;
    for (auto digits = fraction.size(); digits < 3; ++digits)
        scaledMillis *= 10;

    return static_cast<Seconds>(*hours * 3600 + *minutes * 60 + *secs) + static_cast<Seconds>(scaledMillis) / 1000.0;
}

auto parse(std::string_view content) -> std::vector<TextSpan>
{
    if (content.starts_with("\xEF\xBB\xBF"))
        content.remove_prefix(3);

    auto spans = std::vector<TextSpan> {};
    auto block = std::vector<std::string_view> {};

    auto const flush = [&] {
        if (block.empty())
            return;
        if (auto span = parseBlock(block))
            spans.push_back(std::move(*span));
        else
            log::warning("Skipping invalid subtitle block: {}", span.error().message);
        block.clear();
    };

    for (auto const line: splitLines(content))
    {
        auto const trimmed = trim(line);
        if (trimmed.empty())
            flush();
        else
            block.push_back(trimmed);
    }
    flush();

    return spans;
}

auto format(const std::vector<TextSpan>& spans) -> std::string
{
    auto out = std::string {};
    auto index = 1;
    for (auto const& span: spans)
        out += std::format("{}\n{} --> {}\n{}\n\n", index++, formatTime(span.start), formatTime(span.end), span.text);
    return out;
}

auto sidecarPath(std::string_view audioPath) -> std::string
{
    return std::filesystem::path(audioPath).replace_extension(".srt").string();
}

auto readFile(std::string_view path) -> Result<std::vector<TextSpan>>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::IoError, std::format("Cannot open subtitle file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();
    return parse(ss.str());
}

auto writeFile(std::string_view path, const std::vector<TextSpan>& spans) -> VoidResult
{
    auto file = std::ofstream(std::string(path), std::ios::trunc);
    if (!file.is_open())
        return makeError(ErrorCode::IoError, std::format("Cannot write subtitle file: {}", path));

    file << format(spans);
    if (!file)
        return makeError(ErrorCode::IoError, std::format("Failed to write subtitle file: {}", path));

    log::info("Wrote {} subtitle(s) to {}", spans.size(), path);
    return {};
}

} // namespace subplay::srt
