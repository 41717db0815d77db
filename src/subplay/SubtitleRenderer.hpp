// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>
#include <subtitle/SubtitleTrackState.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace subplay
{

/// @brief A line to show below the player status.
struct RenderLine
{
    std::string text;
    bool status = false; ///< A status message rather than subtitle text.

    bool operator==(const RenderLine&) const = default;
};

inline constexpr auto GeneratingSubtitlesText = std::string_view { "Generating subtitles..." };

/// @brief Turns the coverage of the playing track into the line to display.
///
/// Reports a line only when it differs from the one reported last, so callers can redraw
/// on every returned value.
class SubtitleRenderer
{
  public:
    explicit SubtitleRenderer(const SubtitleTrackState& state);

    /// @brief Computes the line for @p position.
    /// @param working Whether transcription for the track is in progress.
    /// @return The new line, or std::nullopt if nothing changed since the last call.
    [[nodiscard]] auto update(Seconds position, bool working) -> std::optional<RenderLine>;

    /// @brief Forces the next update() to report its line, e.g. after the screen was cleared.
    void invalidate();

  private:
    const SubtitleTrackState& _state;
    std::optional<RenderLine> _last;
    Generation _generation = 0;
};

} // namespace subplay
