// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace subplay
{

/// @brief Time offsets and durations within a track, in seconds.
using Seconds = double;

/// @brief Identifies one playback of an audio file within a player session.
using TrackId = std::uint64_t;

/// @brief Monotonic counter that invalidates in-flight work after a track change or reset.
using Generation = std::uint64_t;

/// @brief Fidelity level of a transcription pass.
enum class FidelityTier : std::uint8_t
{
    Preview, ///< Fast, lower quality first pass.
    Full,    ///< Slower, higher quality upgrade.
};

/// @brief Set of tiers the speech engine can currently serve.
using TierSet = std::set<FidelityTier>;

/// @brief Converts a FidelityTier to its string representation.
[[nodiscard]] constexpr auto tierToString(FidelityTier tier) -> std::string_view
{
    switch (tier)
    {
        case FidelityTier::Preview: return "preview";
        case FidelityTier::Full: return "full";
    }
    return "preview";
}

/// @brief Parses a tier name.
/// @return The tier, or std::nullopt if the name is unknown.
[[nodiscard]] constexpr auto tierFromString(std::string_view str) -> std::optional<FidelityTier>
{
    if (str == "preview")
        return FidelityTier::Preview;
    if (str == "full")
        return FidelityTier::Full;
    return std::nullopt;
}

/// @brief Half-open time range [start, end).
struct TimeRange
{
    Seconds start = 0.0;
    Seconds end = 0.0;

    [[nodiscard]] auto length() const -> Seconds { return end - start; }
    [[nodiscard]] auto empty() const -> bool { return end <= start; }
    [[nodiscard]] auto contains(Seconds time) const -> bool { return time >= start && time < end; }
    [[nodiscard]] auto overlaps(const TimeRange& other) const -> bool
    {
        return start < other.end && other.start < end;
    }

    auto operator==(const TimeRange&) const -> bool = default;
};

/// @brief A piece of transcribed text with its absolute position in the track.
struct TextSpan
{
    Seconds start = 0.0;
    Seconds end = 0.0;
    std::string text;

    auto operator==(const TextSpan&) const -> bool = default;
};

/// @brief A committed, tier-tagged time range with the text spans transcribed for it.
struct CoverageInterval
{
    TimeRange range;
    FidelityTier tier = FidelityTier::Preview;
    std::vector<TextSpan> spans;
};

/// @brief One audio file being played.
struct TrackInfo
{
    TrackId id = 0;
    std::string path;
    std::optional<Seconds> duration; ///< Unknown until the file has been probed.
};

/// @brief An ephemeral unit of transcription work.
struct SchedulingRequest
{
    TrackId trackId = 0;
    Generation generation = 0;
    TimeRange range;
    FidelityTier tier = FidelityTier::Preview;

    auto operator==(const SchedulingRequest&) const -> bool = default;
};

} // namespace subplay
