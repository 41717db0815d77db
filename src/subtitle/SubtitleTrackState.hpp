// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <map>
#include <mutex>
#include <optional>
#include <vector>

namespace subplay
{

/// @brief What covers a given instant of the track.
struct CoverageHit
{
    FidelityTier tier = FidelityTier::Preview;
    std::optional<TextSpan> span; ///< The span active at that instant, if the interval has one there.
};

/// @brief Span-free copy of the covered ranges, cheap enough to take on every planning tick.
struct CoverageSnapshot
{
    Generation generation = 0;
    std::vector<TimeRange> preview; ///< Sorted, disjoint.
    std::vector<TimeRange> full;    ///< Sorted, disjoint.
};

#ifdef NDEBUG
inline constexpr auto StrictInvariantsByDefault = false;
#else
inline constexpr auto StrictInvariantsByDefault = true;
#endif

/// @brief Authoritative record of which parts of the current track have been transcribed.
///
/// Intervals of the same tier never overlap. A full-tier commit replaces the overlapping
/// portions of preview intervals; a preview commit never replaces full coverage.
/// Coverage only grows until reset().
///
/// All members are safe to call concurrently; every read and write happens under one mutex,
/// so readers never observe a partially merged interval.
class SubtitleTrackState
{
  public:
    /// @param strictInvariants When true, a same-tier overlap trips an assertion instead of
    ///        being logged and dropped.
    explicit SubtitleTrackState(bool strictInvariants = StrictInvariantsByDefault);

    SubtitleTrackState(const SubtitleTrackState&) = delete;
    SubtitleTrackState& operator=(const SubtitleTrackState&) = delete;

    /// @brief Inserts a coverage interval, applying the tier supersede rule.
    ///
    /// Spans are clamped to the interval, ordered and made non-overlapping; spans with no
    /// text are dropped. Committing an interval that overlaps one of the same tier is a
    /// scheduling defect: the new interval is discarded and InvariantViolation returned.
    /// @return The range whose coverage changed.
    [[nodiscard]] auto commit(CoverageInterval interval) -> Result<TimeRange>;

    /// @brief Looks up what covers @p time, preferring full over preview. O(log n).
    /// @return std::nullopt if the instant is not covered at all.
    [[nodiscard]] auto coverageQuery(Seconds time) const -> std::optional<CoverageHit>;

    /// @brief Clears all intervals and moves to @p newGeneration, which must be greater than the current one.
    [[nodiscard]] auto reset(Generation newGeneration) -> VoidResult;

    [[nodiscard]] auto generation() const -> Generation;

    [[nodiscard]] auto snapshot() const -> CoverageSnapshot;

    /// @brief Returns copies of all intervals of both tiers, ordered by start.
    [[nodiscard]] auto intervals() const -> std::vector<CoverageInterval>;

    /// @brief Returns the effective subtitle text of the track in time order.
    [[nodiscard]] auto spans() const -> std::vector<TextSpan>;

    /// @brief Returns true if @p range is entirely covered by intervals of @p tier.
    [[nodiscard]] auto isCovered(TimeRange range, FidelityTier tier) const -> bool;

  private:
    using IntervalMap = std::map<Seconds, CoverageInterval>;

    [[nodiscard]] auto mapFor(FidelityTier tier) -> IntervalMap&;
    [[nodiscard]] auto mapFor(FidelityTier tier) const -> const IntervalMap&;

    bool _strictInvariants;
    mutable std::mutex _mutex;
    Generation _generation = 0;
    IntervalMap _preview;
    IntervalMap _full;
};

} // namespace subplay
