// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioSource.hpp>
#include <core/Error.hpp>
#include <core/Types.hpp>
#include <scheduler/SegmentPlanner.hpp>
#include <scheduler/TranscriptionWorker.hpp>
#include <speech/SpeechEngine.hpp>
#include <subtitle/SubtitleTrackState.hpp>

#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <vector>

namespace subplay
{

/// @brief Configuration of the background subtitle scheduler.
struct SchedulerConfig
{
    PlannerPolicy planner;
    WorkerConfig worker;
    bool autoTranscribeOnPlay = true;
    bool strictInvariants = StrictInvariantsByDefault;
};

/// @brief Counters describing what the scheduler has done so far.
struct SchedulerStats
{
    std::size_t submitted = 0;
    std::size_t committed = 0;
    std::size_t stale = 0;
    std::size_t failed = 0;
    std::size_t superseded = 0;
    std::size_t cancelled = 0;
    std::size_t rejected = 0;
};

/// @brief Notified after coverage of the current track changed. Called without locks held,
/// possibly on a worker thread.
using CoverageListener = std::function<void(Generation generation, TimeRange range)>;

/// @brief Produces and upgrades subtitles for the playing track in the background.
///
/// The playback thread calls tick() with the current position; tick() plans at most one request,
/// hands it to the transcription worker and returns without waiting. Results are committed into
/// the track state on the worker thread, unless their generation is stale.
class SubtitleScheduler
{
  public:
    SubtitleScheduler(SpeechEngine& engine, AudioSource& audio, SchedulerConfig config);
    ~SubtitleScheduler();

    SubtitleScheduler(const SubtitleScheduler&) = delete;
    SubtitleScheduler& operator=(const SubtitleScheduler&) = delete;

    /// @brief Switches to a new track: invalidates the previous generation before anything else
    /// is scheduled and cancels the previous track's pending work.
    /// @return The generation now current.
    auto beginTrack(TrackInfo track) -> Generation;

    /// @brief Stops scheduling; the current coverage is kept until the next beginTrack().
    void endTrack();

    /// @brief Records the track duration once it is known.
    void setDuration(Seconds duration);

    /// @brief Reacts to a change in compute device capability.
    void setAvailableTiers(TierSet tiers);

    void setCoverageListener(CoverageListener listener);

    /// @brief Commits already existing subtitles (e.g. a sidecar file) as full-tier coverage.
    [[nodiscard]] auto preload(TimeRange range, std::vector<TextSpan> spans) -> VoidResult;

    /// @brief Planning tick. Non-blocking; call only while playing.
    /// @return The decision submitted to the worker, if any.
    auto tick(Seconds position) -> std::optional<ScheduleDecision>;

    /// @brief Read-only view of the current track's subtitle state, for renderers.
    [[nodiscard]] auto trackState() const -> const SubtitleTrackState& { return _state; }

    [[nodiscard]] auto currentTrack() const -> std::optional<TrackInfo>;

    /// @brief Returns true while a request of the current track is outstanding.
    [[nodiscard]] auto isWorking() const -> bool;

    [[nodiscard]] auto stats() const -> SchedulerStats;

  private:
    void handleCompletion(const SchedulingRequest& request, Result<std::vector<TextSpan>> result);
    void notifyCoverage(Generation generation, TimeRange range);

    mutable std::mutex _mutex;
    SchedulerConfig _config;
    SubtitleTrackState _state;
    SegmentPlanner _planner;
    std::optional<TrackInfo> _track;
    bool _active = false;
    SchedulerStats _stats;
    CoverageListener _listener;
    TranscriptionWorker _worker; // Declared last: its threads are joined before the rest is torn down.
};

} // namespace subplay
