// SPDX-License-Identifier: Apache-2.0
#include <scheduler/TranscriptionWorker.hpp>

#include <catch2/catch_test_macros.hpp>

#include <format>
#include <mutex>
#include <optional>

#include "TestFakes.hpp"

using namespace subplay;
using subplay::test::FakeAudioSource;
using subplay::test::FakeSpeechEngine;
using subplay::test::waitUntil;

namespace
{

struct Delivery
{
    SchedulingRequest request;
    std::optional<ErrorCode> error;
    std::vector<TextSpan> spans;
};

/// @brief Thread-safe record of everything the worker delivered.
class Recorder
{
  public:
    auto callback() -> JobCallback
    {
        return [this](const SchedulingRequest& request, Result<std::vector<TextSpan>> result) {
            auto lock = std::lock_guard(_mutex);
            if (result)
                _deliveries.push_back(Delivery { .request = request, .error = std::nullopt, .spans = std::move(*result) });
            else
                _deliveries.push_back(Delivery { .request = request, .error = result.error().code, .spans = {} });
        };
    }

    [[nodiscard]] auto count() const -> std::size_t
    {
        auto lock = std::lock_guard(_mutex);
        return _deliveries.size();
    }

    [[nodiscard]] auto deliveries() const -> std::vector<Delivery>
    {
        auto lock = std::lock_guard(_mutex);
        return _deliveries;
    }

    [[nodiscard]] auto find(const SchedulingRequest& request) const -> std::optional<Delivery>
    {
        auto lock = std::lock_guard(_mutex);
        for (auto const& delivery: _deliveries)
            if (delivery.request == request)
                return delivery;
        return std::nullopt;
    }

  private:
    mutable std::mutex _mutex;
    std::vector<Delivery> _deliveries;
};

auto makeTrack(TrackId id) -> TrackInfo
{
    return TrackInfo { .id = id, .path = std::format("track{}.mp3", id), .duration = 300.0 };
}

auto makeRequest(TrackId trackId, Generation generation, Seconds start, Seconds end) -> SchedulingRequest
{
    return SchedulingRequest {
        .trackId = trackId,
        .generation = generation,
        .range = { .start = start, .end = end },
        .tier = FidelityTier::Preview,
    };
}

} // namespace

TEST_CASE("Worker transcribes a window and reports absolute spans", "[worker]")
{
    auto engine = FakeSpeechEngine {};
    auto audio = FakeAudioSource {};
    auto recorder = Recorder {};
    auto worker = TranscriptionWorker(engine, audio, WorkerConfig {}, recorder.callback());

    auto const request = makeRequest(1, 1, 40.0, 60.0);
    auto const handle = worker.submit(makeTrack(1), request);
    REQUIRE(handle.accepted());

    REQUIRE(waitUntil([&] { return recorder.count() == 1; }));
    auto const delivery = recorder.deliveries().front();
    CHECK(delivery.request == request);
    REQUIRE(!delivery.error.has_value());
    REQUIRE(delivery.spans.size() == 1);
    CHECK(delivery.spans[0] == TextSpan { 40.0, 41.0, "preview" });

    CHECK(handle.status() == JobStatus::Completed);
    CHECK(!worker.isBusy(1));
    CHECK(audio.windows() == std::vector<TimeRange> { { 40.0, 60.0 } });
}

TEST_CASE("Worker keeps one running and one queued request per track", "[worker]")
{
    auto engine = FakeSpeechEngine {};
    auto audio = FakeAudioSource {};
    auto recorder = Recorder {};
    auto worker = TranscriptionWorker(engine, audio, WorkerConfig {}, recorder.callback());
    auto const track = makeTrack(1);

    engine.hold();
    auto const running = makeRequest(1, 1, 0, 20);
    auto const runningHandle = worker.submit(track, running);
    REQUIRE(runningHandle.accepted());
    REQUIRE(waitUntil([&] { return engine.started == 1; }));
    CHECK(worker.isBusy(1));

    SECTION("same generation is rejected while running")
    {
        auto const duplicate = worker.submit(track, makeRequest(1, 1, 20, 40));
        CHECK(!duplicate.accepted());
        CHECK(duplicate.status() == JobStatus::Rejected);

        engine.release();
        REQUIRE(waitUntil([&] { return recorder.count() == 1; }));
        CHECK(engine.calls == 1);
    }

    SECTION("newer generation queues, and a newer request supersedes the queued one")
    {
        auto const queued = makeRequest(1, 2, 0, 20);
        auto const queuedHandle = worker.submit(track, queued);
        REQUIRE(queuedHandle.accepted());
        CHECK(queuedHandle.status() == JobStatus::Queued);

        auto const latest = makeRequest(1, 2, 20, 40);
        auto const latestHandle = worker.submit(track, latest);
        REQUIRE(latestHandle.accepted());

        engine.release();
        REQUIRE(waitUntil([&] { return recorder.count() == 3; }));

        CHECK(engine.calls == 2);
        CHECK(queuedHandle.status() == JobStatus::Superseded);
        CHECK(recorder.find(queued)->error == ErrorCode::Superseded);
        CHECK(!recorder.find(running)->error.has_value());
        CHECK(!recorder.find(latest)->error.has_value());
        CHECK(latestHandle.status() == JobStatus::Completed);
    }

    SECTION("older generation cannot replace a queued request")
    {
        auto const queuedHandle = worker.submit(track, makeRequest(1, 3, 0, 20));
        REQUIRE(queuedHandle.accepted());

        auto const older = worker.submit(track, makeRequest(1, 2, 20, 40));
        CHECK(!older.accepted());

        engine.release();
        REQUIRE(waitUntil([&] { return recorder.count() == 2; }));
        CHECK(queuedHandle.status() == JobStatus::Completed);
    }

    CHECK(runningHandle.status() == JobStatus::Completed);
}

TEST_CASE("Cancelling a track cancels its running and queued work", "[worker]")
{
    auto engine = FakeSpeechEngine {};
    auto audio = FakeAudioSource {};
    auto recorder = Recorder {};
    auto worker = TranscriptionWorker(engine, audio, WorkerConfig {}, recorder.callback());
    auto const track = makeTrack(1);

    engine.hold();
    auto const running = worker.submit(track, makeRequest(1, 1, 0, 20));
    REQUIRE(waitUntil([&] { return engine.started == 1; }));
    auto const queued = worker.submit(track, makeRequest(1, 2, 0, 20));
    REQUIRE(queued.accepted());

    worker.cancelTrack(1);
    CHECK(!worker.isBusy(1));
    engine.release();

    REQUIRE(waitUntil([&] { return recorder.count() == 2; }));
    for (auto const& delivery: recorder.deliveries())
        CHECK(delivery.error == ErrorCode::Cancelled);
    CHECK(running.status() == JobStatus::Cancelled);
    CHECK(queued.status() == JobStatus::Cancelled);
    CHECK(engine.calls == 1);
}

TEST_CASE("Cancelling a queued handle skips the engine call", "[worker]")
{
    auto engine = FakeSpeechEngine {};
    auto audio = FakeAudioSource {};
    auto recorder = Recorder {};
    auto worker = TranscriptionWorker(engine, audio, WorkerConfig {}, recorder.callback());
    auto const track = makeTrack(1);

    engine.hold();
    auto const running = makeRequest(1, 1, 0, 20);
    auto const runningHandle = worker.submit(track, running);
    REQUIRE(waitUntil([&] { return engine.started == 1; }));

    auto const queued = makeRequest(1, 2, 0, 20);
    auto queuedHandle = worker.submit(track, queued);
    REQUIRE(queuedHandle.accepted());
    queuedHandle.cancel();

    engine.release();
    REQUIRE(waitUntil([&] { return recorder.count() == 2; }));

    CHECK(engine.calls == 1);
    CHECK(recorder.find(queued)->error == ErrorCode::Cancelled);
    CHECK(queuedHandle.status() == JobStatus::Cancelled);
    CHECK(!recorder.find(running)->error.has_value());
    CHECK(runningHandle.status() == JobStatus::Completed);
}

TEST_CASE("Cancelling a running handle reports its result as cancelled", "[worker]")
{
    auto engine = FakeSpeechEngine {};
    auto audio = FakeAudioSource {};
    auto recorder = Recorder {};
    auto worker = TranscriptionWorker(engine, audio, WorkerConfig {}, recorder.callback());

    engine.hold();
    auto const request = makeRequest(1, 1, 0, 20);
    auto handle = worker.submit(makeTrack(1), request);
    REQUIRE(waitUntil([&] { return engine.started == 1; }));
    handle.cancel();

    engine.release();
    REQUIRE(waitUntil([&] { return recorder.count() == 1; }));

    CHECK(engine.calls == 1);
    auto const delivery = recorder.find(request);
    REQUIRE(delivery.has_value());
    CHECK(delivery->error == ErrorCode::Cancelled);
    CHECK(delivery->spans.empty());
    CHECK(handle.status() == JobStatus::Cancelled);
}

TEST_CASE("Worker accepts new work for a track after cancelling it", "[worker]")
{
    auto engine = FakeSpeechEngine {};
    auto audio = FakeAudioSource {};
    auto recorder = Recorder {};
    auto worker = TranscriptionWorker(engine, audio, WorkerConfig {}, recorder.callback());

    worker.cancelTrack(1); // Unknown track: nothing to do.

    REQUIRE(worker.submit(makeTrack(1), makeRequest(1, 1, 0, 20)).accepted());
    REQUIRE(waitUntil([&] { return recorder.count() == 1; }));
    worker.cancelTrack(1);

    auto const request = makeRequest(1, 2, 0, 20);
    REQUIRE(worker.submit(makeTrack(1), request).accepted());
    REQUIRE(waitUntil([&] { return recorder.count() == 2; }));
    CHECK(!recorder.find(request)->error.has_value());
}

TEST_CASE("Worker reports engine and decoder failures", "[worker]")
{
    auto engine = FakeSpeechEngine {};
    auto audio = FakeAudioSource {};
    auto recorder = Recorder {};
    auto worker = TranscriptionWorker(engine, audio, WorkerConfig {}, recorder.callback());

    SECTION("engine failure")
    {
        engine.fail = true;
        auto const handle = worker.submit(makeTrack(1), makeRequest(1, 1, 0, 20));
        REQUIRE(waitUntil([&] { return recorder.count() == 1; }));
        CHECK(recorder.deliveries().front().error == ErrorCode::TranscriptionError);
        CHECK(handle.status() == JobStatus::Failed);
    }

    SECTION("decoder failure skips the engine")
    {
        audio.fail = true;
        auto const handle = worker.submit(makeTrack(1), makeRequest(1, 1, 0, 20));
        REQUIRE(waitUntil([&] { return recorder.count() == 1; }));
        CHECK(recorder.deliveries().front().error == ErrorCode::DecodeError);
        CHECK(handle.status() == JobStatus::Failed);
        CHECK(engine.started == 0);
    }
}

TEST_CASE("Tracks are served independently", "[worker]")
{
    auto engine = FakeSpeechEngine {};
    auto audio = FakeAudioSource {};
    auto recorder = Recorder {};
    auto worker = TranscriptionWorker(
        engine, audio, WorkerConfig { .language = "en", .serializeAcrossTracks = false }, recorder.callback());

    auto const first = makeRequest(1, 1, 0, 20);
    auto const second = makeRequest(2, 1, 0, 20);
    REQUIRE(worker.submit(makeTrack(1), first).accepted());
    REQUIRE(worker.submit(makeTrack(2), second).accepted());

    REQUIRE(waitUntil([&] { return recorder.count() == 2; }));
    CHECK(!recorder.find(first)->error.has_value());
    CHECK(!recorder.find(second)->error.has_value());
    CHECK(!worker.isBusy(1));
    CHECK(!worker.isBusy(2));
}

TEST_CASE("Worker rejects submissions after shutdown", "[worker]")
{
    auto engine = FakeSpeechEngine {};
    auto audio = FakeAudioSource {};
    auto recorder = Recorder {};
    auto worker = TranscriptionWorker(engine, audio, WorkerConfig {}, recorder.callback());

    worker.shutdown();
    auto const handle = worker.submit(makeTrack(1), makeRequest(1, 1, 0, 20));
    CHECK(!handle.accepted());
    CHECK(handle.status() == JobStatus::Rejected);
}
