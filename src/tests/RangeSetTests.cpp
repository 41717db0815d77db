// SPDX-License-Identifier: Apache-2.0
#include <core/RangeSet.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace subplay;

TEST_CASE("mergeRanges sorts and joins ranges", "[ranges]")
{
    auto const merged = mergeRanges({ { 30, 40 }, { 0, 10 }, { 10, 15 }, { 5, 8 }, { 50, 50 } });
    CHECK(merged == std::vector<TimeRange> { { 0, 15 }, { 30, 40 } });
    CHECK(mergeRanges({}).empty());
}

TEST_CASE("firstUncovered finds the earliest gap", "[ranges]")
{
    auto const merged = std::vector<TimeRange> { { 0, 20 }, { 30, 50 } };

    CHECK(firstUncovered(merged, { 5, 15 }) == std::nullopt);
    CHECK(firstUncovered(merged, { 5, 25 }) == 20.0);
    CHECK(firstUncovered(merged, { 25, 35 }) == 25.0);
    CHECK(firstUncovered(merged, { 30, 60 }) == 50.0);
    CHECK(firstUncovered(merged, { 10, 10 }) == std::nullopt);
    CHECK(firstUncovered({}, { 3, 4 }) == 3.0);

    CHECK(covers(merged, { 35, 50 }));
    CHECK(!covers(merged, { 15, 35 }));
}

TEST_CASE("Range lookups around an instant", "[ranges]")
{
    auto const merged = std::vector<TimeRange> { { 0, 20 }, { 30, 50 } };

    CHECK(rangeContaining(merged, 35.0) == TimeRange { 30, 50 });
    CHECK(rangeContaining(merged, 0.0) == TimeRange { 0, 20 });
    CHECK(!rangeContaining(merged, 20.0).has_value());
    CHECK(!rangeContaining(merged, 60.0).has_value());

    CHECK(coveredEndBefore(merged, 25.0) == 20.0);
    CHECK(coveredEndBefore(merged, 10.0) == 0.0);
    CHECK(coveredEndBefore(merged, 55.0) == 50.0);

    CHECK(nextStartAfter(merged, 10.0) == 30.0);
    CHECK(nextStartAfter(merged, 30.0) == std::nullopt);
}

TEST_CASE("subtractRanges leaves the uncovered pieces", "[ranges]")
{
    auto const merged = std::vector<TimeRange> { { 10, 20 }, { 30, 40 } };

    CHECK(subtractRanges({ 0, 50 }, merged) == std::vector<TimeRange> { { 0, 10 }, { 20, 30 }, { 40, 50 } });
    CHECK(subtractRanges({ 12, 18 }, merged).empty());
    CHECK(subtractRanges({ 15, 35 }, merged) == std::vector<TimeRange> { { 20, 30 } });
    CHECK(subtractRanges({ 0, 5 }, {}) == std::vector<TimeRange> { { 0, 5 } });
}
