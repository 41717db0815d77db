// SPDX-License-Identifier: Apache-2.0
#include "RangeSet.hpp"

#include <algorithm>
#include <iterator>

namespace subplay
{

auto mergeRanges(std::vector<TimeRange> ranges) -> std::vector<TimeRange>
{
    std::erase_if(ranges, [](const TimeRange& r) { return r.empty(); });
    std::ranges::sort(ranges, {}, &TimeRange::start);

    auto merged = std::vector<TimeRange> {};
    for (auto const& range: ranges)
    {
        if (!merged.empty() && range.start <= merged.back().end)
            merged.back().end = std::max(merged.back().end, range.end);
        else
            merged.push_back(range);
    }
    return merged;
}

auto firstUncovered(const std::vector<TimeRange>& merged, TimeRange window) -> std::optional<Seconds>
{
    if (window.empty())
        return std::nullopt;

    auto cursor = window.start;
    for (auto const& range: merged)
    {
        if (range.end <= cursor)
            continue;
        if (range.start > cursor)
            break;
        cursor = range.end;
        if (cursor >= window.end)
            return std::nullopt;
    }
    return cursor;
}

auto covers(const std::vector<TimeRange>& merged, TimeRange range) -> bool
{
    return !firstUncovered(merged, range).has_value();
}

auto rangeContaining(const std::vector<TimeRange>& merged, Seconds time) -> std::optional<TimeRange>
{
    auto const it = std::ranges::upper_bound(merged, time, {}, &TimeRange::start);
    if (it == merged.begin())
        return std::nullopt;
    auto const& candidate = *std::prev(it);
    if (candidate.contains(time))
        return candidate;
    return std::nullopt;
}

auto coveredEndBefore(const std::vector<TimeRange>& merged, Seconds time) -> Seconds
{
    auto result = Seconds { 0.0 };
    for (auto const& range: merged)
    {
        if (range.end > time)
            break;
        result = range.end;
    }
    return result;
}

auto nextStartAfter(const std::vector<TimeRange>& merged, Seconds time) -> std::optional<Seconds>
{
    auto const it = std::ranges::upper_bound(merged, time, {}, &TimeRange::start);
    if (it == merged.end())
        return std::nullopt;
    return it->start;
}

auto subtractRanges(TimeRange range, const std::vector<TimeRange>& merged) -> std::vector<TimeRange>
{
    auto pieces = std::vector<TimeRange> {};
    auto cursor = range.start;
    for (auto const& cut: merged)
    {
        if (cut.end <= cursor)
            continue;
        if (cut.start >= range.end)
            break;
        if (cut.start > cursor)
            pieces.push_back(TimeRange { .start = cursor, .end = cut.start });
        cursor = std::max(cursor, cut.end);
        if (cursor >= range.end)
            break;
    }
    if (cursor < range.end)
        pieces.push_back(TimeRange { .start = cursor, .end = range.end });
    return pieces;
}

} // namespace subplay
