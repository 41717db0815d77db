// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace subplay::srt
{

/// @brief Formats seconds as an SRT timestamp ("hh:mm:ss,mmm").
[[nodiscard]] auto formatTime(Seconds seconds) -> std::string;

/// @brief Formats seconds for display ("hh:mm:ss").
[[nodiscard]] auto formatTimestamp(Seconds seconds) -> std::string;

/// @brief Parses an SRT timestamp ("hh:mm:ss,mmm"); a '.' millisecond separator is accepted too.
[[nodiscard]] auto parseTime(std::string_view text) -> Result<Seconds>;

/// @brief Parses an SRT document. Malformed blocks are skipped with a warning.
///
/// Multi-line cue text is joined with single spaces.
[[nodiscard]] auto parse(std::string_view content) -> std::vector<TextSpan>;

/// @brief Renders spans as an SRT document, numbering cues from 1.
[[nodiscard]] auto format(const std::vector<TextSpan>& spans) -> std::string;

/// @brief Returns the sidecar subtitle path of an audio file ("song.mp3" -> "song.srt").
[[nodiscard]] auto sidecarPath(std::string_view audioPath) -> std::string;

/// @brief Reads and parses an SRT file.
[[nodiscard]] auto readFile(std::string_view path) -> Result<std::vector<TextSpan>>;

/// @brief Writes spans as an SRT file.
[[nodiscard]] auto writeFile(std::string_view path, const std::vector<TextSpan>& spans) -> VoidResult;

} // namespace subplay::srt
