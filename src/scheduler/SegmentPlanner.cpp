// SPDX-License-Identifier: Apache-2.0
#include "SegmentPlanner.hpp"

#include <core/Log.hpp>
#include <core/RangeSet.hpp>

#include <algorithm>
#include <cmath>

namespace subplay
{

namespace
{

    auto concat(std::vector<TimeRange> a, const std::vector<TimeRange>& b) -> std::vector<TimeRange>
    {
        a.insert(a.end(), b.begin(), b.end());
        return a;
    }

} // namespace

SegmentPlanner::SegmentPlanner(PlannerPolicy policy): _policy(std::move(policy))
{
}

void SegmentPlanner::beginTrack(TrackId trackId, Generation generation, std::optional<Seconds> duration)
{
    _trackId = trackId;
    _generation = generation;
    _duration = duration;
    _outstanding.reset();
    _failures.clear();
}

void SegmentPlanner::setDuration(Seconds duration)
{
    _duration = duration;
}

void SegmentPlanner::setAvailableTiers(TierSet tiers)
{
    _policy.availableTiers = std::move(tiers);
}

auto SegmentPlanner::coverageTier() const -> std::optional<FidelityTier>
{
    auto const& tiers = _policy.availableTiers;
    if (_policy.tierPolicy == TierPolicy::Fixed)
    {
        if (tiers.contains(_policy.fixedTier))
            return _policy.fixedTier;
        return std::nullopt;
    }

    if (tiers.contains(FidelityTier::Preview))
        return FidelityTier::Preview;
    if (tiers.contains(FidelityTier::Full))
        return FidelityTier::Full;
    return std::nullopt;
}

auto SegmentPlanner::upgradesEnabled() const -> bool
{
    return _policy.tierPolicy == TierPolicy::Adaptive && _policy.enableFullTranscription
           && _policy.availableTiers.contains(FidelityTier::Preview)
           && _policy.availableTiers.contains(FidelityTier::Full);
}

auto SegmentPlanner::segmentLength(FidelityTier tier) const -> Seconds
{
    return tier == FidelityTier::Preview ? _policy.previewSeconds : _policy.fullChunkSeconds;
}

auto SegmentPlanner::blockedWindows(FidelityTier tier, Clock::time_point now) const -> std::vector<TimeRange>
{
    auto blocked = std::vector<TimeRange> {};
    for (auto const& failed: _failures)
        if (failed.tier == tier && now < failed.retryAt)
            blocked.push_back(failed.range);
    return blocked;
}

auto SegmentPlanner::planCoverage(const CoverageSnapshot& coverage, Seconds position, Clock::time_point now) const
    -> std::optional<TimeRange>
{
    auto const tier = coverageTier();
    if (!tier)
        return std::nullopt;

    auto window = TimeRange { .start = std::max(position, 0.0), .end = position + _policy.leadSeconds };
    if (_duration)
        window.end = std::min(window.end, *_duration);
    if (window.empty())
        return std::nullopt;

    auto const blocked =
        mergeRanges(concat(concat(coverage.preview, coverage.full), blockedWindows(*tier, now)));

    auto const uncovered = firstUncovered(blocked, window);
    if (!uncovered)
        return std::nullopt;

    // Segments are aligned to a grid of the segment length, but never reach back into covered audio.
    auto const length = segmentLength(*tier);
    auto const cellStart = std::floor(*uncovered / length) * length;
    auto const start = std::max(cellStart, coveredEndBefore(blocked, *uncovered));

    auto end = start + length;
    if (auto const next = nextStartAfter(blocked, start))
        end = std::min(end, *next);
    if (_duration)
        end = std::min(end, *_duration);

    if (end <= start)
        return std::nullopt;
    return TimeRange { .start = start, .end = end };
}

auto SegmentPlanner::planUpgrade(const CoverageSnapshot& coverage, Seconds position, Clock::time_point now) const
    -> std::optional<TimeRange>
{
    if (position < _policy.upgradeStartAfterSeconds)
        return std::nullopt;

    auto const fullBlocked = mergeRanges(concat(coverage.full, blockedWindows(FidelityTier::Full, now)));
    auto const committed = mergeRanges(concat(coverage.preview, coverage.full));

    // Oldest preview coverage first, so upgrades make steady forward progress.
    for (auto const& preview: mergeRanges(coverage.preview))
    {
        if (preview.start > position)
            break;

        auto const candidate = firstUncovered(fullBlocked, preview);
        if (!candidate)
            continue;

        auto const run = rangeContaining(committed, *candidate);
        if (!run)
            continue;

        auto limit = run->end;
        if (auto const next = nextStartAfter(fullBlocked, *candidate))
            limit = std::min(limit, *next);
        if (_duration)
            limit = std::min(limit, *_duration);

        auto const chunkEnd = *candidate + _policy.fullChunkSeconds;
        if (chunkEnd <= limit)
            return TimeRange { .start = *candidate, .end = chunkEnd };

        // The chunk would run past the coverage frontier, which is still growing ahead of playback.
        auto const frontierAhead =
            limit == run->end && run->end > position && (!_duration || run->end < *_duration);
        if (frontierAhead)
            return std::nullopt;

        if (limit > *candidate)
            return TimeRange { .start = *candidate, .end = limit };
    }
    return std::nullopt;
}

auto SegmentPlanner::planNext(const CoverageSnapshot& coverage, Seconds position, Clock::time_point now)
    -> std::optional<ScheduleDecision>
{
    if (_outstanding)
        return std::nullopt;

    if (coverage.generation != _generation)
    {
        log::trace("Planner skips coverage of generation {} (planning for {})", coverage.generation, _generation);
        return std::nullopt;
    }

    auto decision = std::optional<ScheduleDecision> {};

    if (auto const window = planCoverage(coverage, position, now))
    {
        decision = ScheduleDecision {
            .request = SchedulingRequest {
                .trackId = _trackId,
                .generation = _generation,
                .range = *window,
                .tier = *coverageTier(),
            },
            .reason = PlanReason::Coverage,
        };
    }
    else if (upgradesEnabled())
    {
        if (auto const upgrade = planUpgrade(coverage, position, now))
        {
            decision = ScheduleDecision {
                .request = SchedulingRequest {
                    .trackId = _trackId,
                    .generation = _generation,
                    .range = *upgrade,
                    .tier = FidelityTier::Full,
                },
                .reason = PlanReason::Upgrade,
            };
        }
    }

    if (decision)
    {
        _outstanding = decision->request;
        log::debug("Planned {} [{:.1f}s, {:.1f}s) at position {:.1f}s ({})",
                   tierToString(decision->request.tier),
                   decision->request.range.start,
                   decision->request.range.end,
                   position,
                   decision->reason == PlanReason::Coverage ? "coverage" : "upgrade");
    }
    return decision;
}

void SegmentPlanner::markResolved(const SchedulingRequest& request)
{
    if (_outstanding && *_outstanding == request)
        _outstanding.reset();

    if (request.generation != _generation)
        return;

    std::erase_if(_failures, [&](const FailedWindow& failed) {
        return failed.tier == request.tier && failed.range == request.range;
    });
}

void SegmentPlanner::markFailed(const SchedulingRequest& request, Clock::time_point now)
{
    if (_outstanding && *_outstanding == request)
        _outstanding.reset();

    if (request.generation != _generation)
        return;

    auto it = std::ranges::find_if(_failures, [&](const FailedWindow& failed) {
        return failed.tier == request.tier && failed.range == request.range;
    });
    if (it == _failures.end())
        it = _failures.insert(_failures.end(), FailedWindow { .tier = request.tier, .range = request.range });

    ++it->failures;
    auto const backoff = std::min(_policy.minRetryBackoffSeconds * std::pow(2.0, it->failures - 1),
                                  _policy.maxRetryBackoffSeconds);
    it->retryAt = now + std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(backoff));

    log::debug("Window {} [{:.1f}s, {:.1f}s) failed {} time(s); retry in {:.1f}s",
               tierToString(request.tier),
               request.range.start,
               request.range.end,
               it->failures,
               backoff);
}

} // namespace subplay
