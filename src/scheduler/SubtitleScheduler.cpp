// SPDX-License-Identifier: Apache-2.0
#include "SubtitleScheduler.hpp"

#include <core/Log.hpp>

#include <utility>

namespace subplay
{

SubtitleScheduler::SubtitleScheduler(SpeechEngine& engine, AudioSource& audio, SchedulerConfig config):
    _config(std::move(config)),
    _state(_config.strictInvariants),
    _planner(_config.planner),
    _worker(engine,
            audio,
            _config.worker,
            [this](const SchedulingRequest& request, Result<std::vector<TextSpan>> result) {
                handleCompletion(request, std::move(result));
            })
{
    _planner.setAvailableTiers(engine.availableTiers());
}

SubtitleScheduler::~SubtitleScheduler()
{
    _worker.shutdown();
}

auto SubtitleScheduler::beginTrack(TrackInfo track) -> Generation
{
    auto lock = std::lock_guard(_mutex);

    if (_track)
        _worker.cancelTrack(_track->id);

    auto const generation = _state.generation() + 1;
    if (auto result = _state.reset(generation); !result)
        log::error("Failed to reset subtitle state: {}", result.error().message);

    _planner.beginTrack(track.id, generation, track.duration);
    log::debug("Subtitle generation {} for track {} ({})", generation, track.id, track.path);

    _track = std::move(track);
    _active = true;
    return generation;
}

void SubtitleScheduler::endTrack()
{
    auto lock = std::lock_guard(_mutex);
    if (_track)
        _worker.cancelTrack(_track->id);
    _active = false;
}

void SubtitleScheduler::setDuration(Seconds duration)
{
    auto lock = std::lock_guard(_mutex);
    if (_track)
        _track->duration = duration;
    _planner.setDuration(duration);
}

void SubtitleScheduler::setAvailableTiers(TierSet tiers)
{
    auto lock = std::lock_guard(_mutex);
    if (!tiers.contains(FidelityTier::Full))
        log::info("Full-tier transcription unavailable; keeping preview subtitles only");
    _planner.setAvailableTiers(std::move(tiers));
}

void SubtitleScheduler::setCoverageListener(CoverageListener listener)
{
    auto lock = std::lock_guard(_mutex);
    _listener = std::move(listener);
}

auto SubtitleScheduler::preload(TimeRange range, std::vector<TextSpan> spans) -> VoidResult
{
    auto generation = Generation {};
    auto committed = Result<TimeRange> {};
    {
        auto lock = std::lock_guard(_mutex);
        if (!_track)
            return makeError(ErrorCode::InvalidArgument, "No track to preload subtitles into");

        generation = _state.generation();
        committed = _state.commit(CoverageInterval {
            .range = range,
            .tier = FidelityTier::Full,
            .spans = std::move(spans),
        });
        if (!committed)
            return std::unexpected(committed.error());
        ++_stats.committed;
    }

    notifyCoverage(generation, *committed);
    return {};
}

auto SubtitleScheduler::tick(Seconds position) -> std::optional<ScheduleDecision>
{
    auto lock = std::lock_guard(_mutex);

    if (!_track || !_active || !_config.autoTranscribeOnPlay)
        return std::nullopt;

    if (_worker.isBusy(_track->id))
        return std::nullopt;

    auto decision = _planner.planNext(_state.snapshot(), position, SegmentPlanner::Clock::now());
    if (!decision)
        return std::nullopt;

    auto handle = _worker.submit(*_track, decision->request);
    if (!handle.accepted())
    {
        ++_stats.rejected;
        _planner.markResolved(decision->request);
        log::debug("Worker rejected {} request [{:.1f}s, {:.1f}s)",
                   tierToString(decision->request.tier),
                   decision->request.range.start,
                   decision->request.range.end);
        return std::nullopt;
    }

    ++_stats.submitted;
    return decision;
}

auto SubtitleScheduler::currentTrack() const -> std::optional<TrackInfo>
{
    auto lock = std::lock_guard(_mutex);
    return _track;
}

auto SubtitleScheduler::isWorking() const -> bool
{
    auto lock = std::lock_guard(_mutex);
    return _active && _planner.outstanding().has_value();
}

auto SubtitleScheduler::stats() const -> SchedulerStats
{
    auto lock = std::lock_guard(_mutex);
    return _stats;
}

void SubtitleScheduler::handleCompletion(const SchedulingRequest& request, Result<std::vector<TextSpan>> result)
{
    auto changed = std::optional<TimeRange> {};
    {
        auto lock = std::lock_guard(_mutex);

        if (!result
            && (result.error().code == ErrorCode::Cancelled || result.error().code == ErrorCode::Superseded))
        {
            if (result.error().code == ErrorCode::Cancelled)
                ++_stats.cancelled;
            else
                ++_stats.superseded;
            _planner.markResolved(request);
            return;
        }

        auto const current = _track && _active && request.trackId == _track->id
                             && request.generation == _state.generation();
        if (!current)
        {
            ++_stats.stale;
            log::debug("Discarding stale {} result [{:.1f}s, {:.1f}s) of generation {}",
                       tierToString(request.tier),
                       request.range.start,
                       request.range.end,
                       request.generation);
            return;
        }

        if (!result)
        {
            ++_stats.failed;
            log::warning("Transcription of [{:.1f}s, {:.1f}s) ({}) failed: {}",
                         request.range.start,
                         request.range.end,
                         tierToString(request.tier),
                         result.error());
            _planner.markFailed(request, SegmentPlanner::Clock::now());
            return;
        }

        auto committed = _state.commit(CoverageInterval {
            .range = request.range,
            .tier = request.tier,
            .spans = std::move(*result),
        });
        _planner.markResolved(request);

        if (!committed)
        {
            log::error("Discarded result of [{:.1f}s, {:.1f}s): {}",
                       request.range.start,
                       request.range.end,
                       committed.error());
            return;
        }

        ++_stats.committed;
        changed = *committed;
    }

    if (changed)
        notifyCoverage(request.generation, *changed);
}

void SubtitleScheduler::notifyCoverage(Generation generation, TimeRange range)
{
    auto listener = CoverageListener {};
    {
        auto lock = std::lock_guard(_mutex);
        listener = _listener;
    }
    if (listener)
        listener(generation, range);
}

} // namespace subplay
