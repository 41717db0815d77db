// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>
#include <subtitle/SubtitleTrackState.hpp>

#include <chrono>
#include <optional>
#include <vector>

namespace subplay
{

/// @brief How the planner chooses transcription tiers.
enum class TierPolicy : std::uint8_t
{
    Adaptive, ///< Preview ahead of playback, full-tier upgrade behind it.
    Fixed,    ///< A single configured tier, never upgraded.
};

/// @brief Tuning parameters of the segment planner.
struct PlannerPolicy
{
    Seconds previewSeconds = 20.0;           ///< Length of a coverage (preview) segment.
    Seconds leadSeconds = 12.0;              ///< How far ahead of playback coverage must exist.
    Seconds upgradeStartAfterSeconds = 60.0; ///< Playback position before upgrades begin.
    Seconds fullChunkSeconds = 45.0;         ///< Length of a full-tier upgrade chunk.
    Seconds minRetryBackoffSeconds = 5.0;    ///< Delay before a failed window is planned again.
    Seconds maxRetryBackoffSeconds = 60.0;   ///< Upper bound of the doubling retry delay.
    TierPolicy tierPolicy = TierPolicy::Adaptive;
    FidelityTier fixedTier = FidelityTier::Preview;
    bool enableFullTranscription = true;
    TierSet availableTiers { FidelityTier::Preview, FidelityTier::Full };
};

/// @brief Why a request was planned.
enum class PlanReason : std::uint8_t
{
    Coverage, ///< Fill uncovered audio ahead of playback.
    Upgrade,  ///< Re-transcribe preview coverage at full fidelity.
};

/// @brief A planned unit of work.
struct ScheduleDecision
{
    SchedulingRequest request;
    PlanReason reason = PlanReason::Coverage;
};

/// @brief Decides which audio window of the current track to transcribe next, and at which tier.
///
/// The planner keeps at most one request outstanding per track: while one is outstanding,
/// planNext() returns std::nullopt without looking at coverage. Coverage ahead of playback
/// always wins over upgrades. Windows whose transcription failed are not planned again until
/// their retry backoff expired; the backoff doubles on every consecutive failure.
class SegmentPlanner
{
  public:
    using Clock = std::chrono::steady_clock;

    explicit SegmentPlanner(PlannerPolicy policy = {});

    /// @brief Starts planning for a new track generation, forgetting outstanding work and failures.
    void beginTrack(TrackId trackId, Generation generation, std::optional<Seconds> duration);

    /// @brief Updates the track duration once it becomes known.
    void setDuration(Seconds duration);

    /// @brief Replaces the set of tiers the speech engine can serve.
    void setAvailableTiers(TierSet tiers);

    /// @brief Computes the next request for the current track.
    ///
    /// Idempotent: with unchanged coverage and position, a second call returns std::nullopt
    /// because the first decision is still outstanding.
    /// @param coverage Current coverage of the track.
    /// @param position Playback position in seconds.
    /// @param now Current time, used for retry backoff.
    [[nodiscard]] auto planNext(const CoverageSnapshot& coverage, Seconds position, Clock::time_point now)
        -> std::optional<ScheduleDecision>;

    /// @brief Marks an outstanding request as finished (committed, discarded or cancelled).
    void markResolved(const SchedulingRequest& request);

    /// @brief Marks an outstanding request as failed and starts its retry backoff.
    void markFailed(const SchedulingRequest& request, Clock::time_point now);

    [[nodiscard]] auto outstanding() const -> const std::optional<SchedulingRequest>& { return _outstanding; }
    [[nodiscard]] auto generation() const -> Generation { return _generation; }

  private:
    struct FailedWindow
    {
        FidelityTier tier;
        TimeRange range;
        int failures = 0;
        Clock::time_point retryAt;
    };

    [[nodiscard]] auto coverageTier() const -> std::optional<FidelityTier>;
    [[nodiscard]] auto upgradesEnabled() const -> bool;
    [[nodiscard]] auto blockedWindows(FidelityTier tier, Clock::time_point now) const -> std::vector<TimeRange>;
    [[nodiscard]] auto planCoverage(const CoverageSnapshot& coverage, Seconds position, Clock::time_point now) const
        -> std::optional<TimeRange>;
    [[nodiscard]] auto planUpgrade(const CoverageSnapshot& coverage, Seconds position, Clock::time_point now) const
        -> std::optional<TimeRange>;
    [[nodiscard]] auto segmentLength(FidelityTier tier) const -> Seconds;

    PlannerPolicy _policy;
    TrackId _trackId = 0;
    Generation _generation = 0;
    std::optional<Seconds> _duration;
    std::optional<SchedulingRequest> _outstanding;
    std::vector<FailedWindow> _failures;
};

} // namespace subplay
