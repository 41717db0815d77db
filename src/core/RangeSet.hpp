// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>

#include <optional>
#include <vector>

namespace subplay
{

/// @brief Sorts ranges by start and merges overlapping or touching ones. Empty ranges are dropped.
[[nodiscard]] auto mergeRanges(std::vector<TimeRange> ranges) -> std::vector<TimeRange>;

/// @brief Returns the first instant of @p window that none of the merged ranges covers.
/// @param merged Output of mergeRanges().
/// @param window The window to inspect.
/// @return The earliest uncovered instant, or std::nullopt if the window is fully covered.
[[nodiscard]] auto firstUncovered(const std::vector<TimeRange>& merged, TimeRange window)
    -> std::optional<Seconds>;

/// @brief Returns true if the merged ranges cover all of @p range.
[[nodiscard]] auto covers(const std::vector<TimeRange>& merged, TimeRange range) -> bool;

/// @brief Returns the merged range containing @p time, if any.
[[nodiscard]] auto rangeContaining(const std::vector<TimeRange>& merged, Seconds time)
    -> std::optional<TimeRange>;

/// @brief Returns the end of the last merged range that ends at or before @p time, or 0.
[[nodiscard]] auto coveredEndBefore(const std::vector<TimeRange>& merged, Seconds time) -> Seconds;

/// @brief Returns the start of the first merged range that starts after @p time.
[[nodiscard]] auto nextStartAfter(const std::vector<TimeRange>& merged, Seconds time) -> std::optional<Seconds>;

/// @brief Returns the parts of @p range not covered by the merged ranges, in time order.
[[nodiscard]] auto subtractRanges(TimeRange range, const std::vector<TimeRange>& merged)
    -> std::vector<TimeRange>;

} // namespace subplay
