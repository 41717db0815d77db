// SPDX-License-Identifier: Apache-2.0
#include "SubtitleTrackState.hpp"

#include <core/Log.hpp>
#include <core/RangeSet.hpp>

#include <algorithm>
#include <cassert>
#include <format>
#include <iterator>

namespace subplay
{

namespace
{

    auto trimmed(std::string_view text) -> std::string
    {
        auto const start = text.find_first_not_of(" \t\n\r");
        if (start == std::string_view::npos)
            return {};
        auto const end = text.find_last_not_of(" \t\n\r");
        return std::string(text.substr(start, end - start + 1));
    }

    /// @brief Clamps spans into @p range, orders them and removes overlaps and empty text.
    auto normalizeSpans(std::vector<TextSpan> spans, TimeRange range) -> std::vector<TextSpan>
    {
        for (auto& span: spans)
        {
            span.text = trimmed(span.text);
            span.start = std::max(span.start, range.start);
            span.end = std::min(span.end, range.end);
        }
        std::erase_if(spans, [](const TextSpan& s) { return s.text.empty() || s.end <= s.start; });
        std::ranges::stable_sort(spans, {}, &TextSpan::start);

        auto result = std::vector<TextSpan> {};
        result.reserve(spans.size());
        for (auto& span: spans)
        {
            if (!result.empty() && span.start < result.back().end)
                span.start = result.back().end;
            if (span.end <= span.start)
                continue;
            result.push_back(std::move(span));
        }
        return result;
    }

    /// @brief Returns the parts of @p spans that fall inside @p piece, clipped to it.
    auto spansWithin(const std::vector<TextSpan>& spans, TimeRange piece) -> std::vector<TextSpan>
    {
        auto result = std::vector<TextSpan> {};
        for (auto const& span: spans)
        {
            auto const start = std::max(span.start, piece.start);
            auto const end = std::min(span.end, piece.end);
            if (start < end)
                result.push_back(TextSpan { .start = start, .end = end, .text = span.text });
        }
        return result;
    }

    template <typename Map>
    auto overlappingKeys(const Map& map, TimeRange range) -> std::vector<Seconds>
    {
        auto keys = std::vector<Seconds> {};
        auto it = map.upper_bound(range.start);
        if (it != map.begin())
        {
            auto const prev = std::prev(it);
            if (prev->second.range.end > range.start)
                it = prev;
        }
        for (; it != map.end() && it->first < range.end; ++it)
            if (it->second.range.overlaps(range))
                keys.push_back(it->first);
        return keys;
    }

    template <typename Map>
    auto rangesOf(const Map& map) -> std::vector<TimeRange>
    {
        auto ranges = std::vector<TimeRange> {};
        ranges.reserve(map.size());
        for (auto const& [start, interval]: map)
            ranges.push_back(interval.range);
        return ranges;
    }

    auto spanAt(const std::vector<TextSpan>& spans, Seconds time) -> std::optional<TextSpan>
    {
        auto const it = std::ranges::upper_bound(spans, time, {}, &TextSpan::start);
        if (it == spans.begin())
            return std::nullopt;
        auto const& candidate = *std::prev(it);
        if (time < candidate.end)
            return candidate;
        return std::nullopt;
    }

} // namespace

SubtitleTrackState::SubtitleTrackState(bool strictInvariants): _strictInvariants(strictInvariants)
{
}

auto SubtitleTrackState::mapFor(FidelityTier tier) -> IntervalMap&
{
    return tier == FidelityTier::Full ? _full : _preview;
}

auto SubtitleTrackState::mapFor(FidelityTier tier) const -> const IntervalMap&
{
    return tier == FidelityTier::Full ? _full : _preview;
}

auto SubtitleTrackState::commit(CoverageInterval interval) -> Result<TimeRange>
{
    auto const range = interval.range;
    auto const tier = interval.tier;
    if (range.empty())
        return makeError(ErrorCode::InvalidArgument,
                         std::format("Empty coverage interval [{:.3f}, {:.3f})", range.start, range.end));

    interval.spans = normalizeSpans(std::move(interval.spans), range);

    auto lock = std::lock_guard(_mutex);

    if (!overlappingKeys(mapFor(interval.tier), range).empty())
    {
        log::error("Dropping {} interval [{:.2f}s, {:.2f}s): overlaps existing coverage of the same tier",
                   tierToString(interval.tier),
                   range.start,
                   range.end);
        if (_strictInvariants)
            assert(false && "same-tier coverage intervals must never overlap");
        return makeError(
            ErrorCode::InvariantViolation,
            std::format("{} interval [{:.3f}, {:.3f}) overlaps existing coverage of the same tier",
                        tierToString(interval.tier),
                        range.start,
                        range.end));
    }

    if (interval.tier == FidelityTier::Full)
    {
        auto const cut = std::vector<TimeRange> { range };
        for (auto const key: overlappingKeys(_preview, range))
        {
            auto node = _preview.extract(key);
            auto const& old = node.mapped();
            for (auto const& piece: subtractRanges(old.range, cut))
                _preview.emplace(piece.start,
                                 CoverageInterval {
                                     .range = piece,
                                     .tier = FidelityTier::Preview,
                                     .spans = spansWithin(old.spans, piece),
                                 });
        }
        _full.emplace(range.start, std::move(interval));
    }
    else
    {
        for (auto const& piece: subtractRanges(range, rangesOf(_full)))
            _preview.emplace(piece.start,
                             CoverageInterval {
                                 .range = piece,
                                 .tier = FidelityTier::Preview,
                                 .spans = spansWithin(interval.spans, piece),
                             });
    }

    log::trace("Committed {} coverage [{:.2f}s, {:.2f}s) for generation {}",
               tierToString(tier),
               range.start,
               range.end,
               _generation);
    return range;
}

auto SubtitleTrackState::coverageQuery(Seconds time) const -> std::optional<CoverageHit>
{
    auto lock = std::lock_guard(_mutex);

    for (auto const tier: { FidelityTier::Full, FidelityTier::Preview })
    {
        auto const& map = mapFor(tier);
        auto it = map.upper_bound(time);
        if (it == map.begin())
            continue;
        --it;
        if (it->second.range.contains(time))
            return CoverageHit { .tier = tier, .span = spanAt(it->second.spans, time) };
    }
    return std::nullopt;
}

auto SubtitleTrackState::reset(Generation newGeneration) -> VoidResult
{
    auto lock = std::lock_guard(_mutex);
    if (newGeneration <= _generation)
        return makeError(ErrorCode::InvalidArgument,
                         std::format("Generation must increase (current {}, requested {})",
                                     _generation,
                                     newGeneration));

    _preview.clear();
    _full.clear();
    _generation = newGeneration;
    return {};
}

auto SubtitleTrackState::generation() const -> Generation
{
    auto lock = std::lock_guard(_mutex);
    return _generation;
}

auto SubtitleTrackState::snapshot() const -> CoverageSnapshot
{
    auto lock = std::lock_guard(_mutex);
    return CoverageSnapshot {
        .generation = _generation,
        .preview = rangesOf(_preview),
        .full = rangesOf(_full),
    };
}

auto SubtitleTrackState::intervals() const -> std::vector<CoverageInterval>
{
    auto lock = std::lock_guard(_mutex);

    auto result = std::vector<CoverageInterval> {};
    result.reserve(_preview.size() + _full.size());
    for (auto const& [start, interval]: _preview)
        result.push_back(interval);
    for (auto const& [start, interval]: _full)
        result.push_back(interval);
    std::ranges::sort(result, {}, [](const CoverageInterval& i) { return i.range.start; });
    return result;
}

auto SubtitleTrackState::spans() const -> std::vector<TextSpan>
{
    auto lock = std::lock_guard(_mutex);

    auto result = std::vector<TextSpan> {};
    for (auto const* map: { &_preview, &_full })
        for (auto const& [start, interval]: *map)
            result.insert(result.end(), interval.spans.begin(), interval.spans.end());
    std::ranges::stable_sort(result, {}, &TextSpan::start);
    return result;
}

auto SubtitleTrackState::isCovered(TimeRange range, FidelityTier tier) const -> bool
{
    auto lock = std::lock_guard(_mutex);
    return covers(mergeRanges(rangesOf(mapFor(tier))), range);
}

} // namespace subplay
