// SPDX-License-Identifier: Apache-2.0
#include <core/Error.hpp>
#include <core/Log.hpp>
#include <core/Types.hpp>

#include <catch2/catch_test_macros.hpp>

#include <format>
#include <string>
#include <utility>
#include <vector>

using namespace subplay;

TEST_CASE("Errors format with their code name", "[core]")
{
    auto const error = Error { .code = ErrorCode::DecodeError, .message = "truncated frame" };
    CHECK(std::format("{}", error) == "[decode] truncated frame");
    CHECK(errorCodeName(ErrorCode::DeviceUnavailable) == "device-unavailable");
    CHECK(errorCodeName(ErrorCode::InvariantViolation) == "invariant");

    auto const result = Result<int>(makeError(ErrorCode::IoError, "gone"));
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::IoError);
    CHECK(result.error().message == "gone");
}

TEST_CASE("Fidelity tier names", "[core]")
{
    CHECK(tierToString(FidelityTier::Preview) == "preview");
    CHECK(tierToString(FidelityTier::Full) == "full");
    CHECK(tierFromString("full") == FidelityTier::Full);
    CHECK(tierFromString("preview") == FidelityTier::Preview);
    CHECK(!tierFromString("ultra").has_value());
}

TEST_CASE("Time ranges are half-open", "[core]")
{
    auto const range = TimeRange { 10, 20 };
    CHECK(range.length() == 10.0);
    CHECK(range.contains(10.0));
    CHECK(!range.contains(20.0));
    CHECK(range.overlaps({ 19, 30 }));
    CHECK(!range.overlaps({ 20, 30 }));
    CHECK(TimeRange { 5, 5 }.empty());
}

TEST_CASE("Log levels parse from names", "[core]")
{
    CHECK(log::levelFromString("warn") == log::Level::Warning);
    CHECK(log::levelFromString("trace") == log::Level::Trace);
    CHECK(!log::levelFromString("verbose").has_value());
    CHECK(log::levelToString(log::Level::Debug) == "debug");
}

TEST_CASE("Log messages are filtered by level and routed to the callback", "[core]")
{
    auto messages = std::vector<std::pair<log::Level, std::string>> {};
    log::setCallback([&](log::Level level, std::string_view message) { messages.emplace_back(level, message); });
    auto const previousLevel = log::getLevel();
    log::setLevel(log::Level::Info);

    log::info("track {}", 3);
    log::debug("hidden");
    log::error("failed: {}", "boom");

    log::setLevel(previousLevel);
    log::setCallback({});

    REQUIRE(messages.size() == 2);
    CHECK(messages[0] == std::pair<log::Level, std::string> { log::Level::Info, "track 3" });
    CHECK(messages[1] == std::pair<log::Level, std::string> { log::Level::Error, "failed: boom" });
}
