// SPDX-License-Identifier: Apache-2.0
#include "TranscriptionWorker.hpp"

#include <core/Log.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <format>
#include <map>
#include <mutex>
#include <optional>
#include <thread>
#include <utility>

namespace subplay
{

struct JobHandle::State
{
    SchedulingRequest request;
    std::atomic<JobStatus> status { JobStatus::Queued };
    std::atomic<bool> cancelled { false };
};

JobHandle::JobHandle(std::shared_ptr<State> state): _state(std::move(state))
{
}

auto JobHandle::accepted() const -> bool
{
    return _state && _state->status.load() != JobStatus::Rejected;
}

auto JobHandle::status() const -> JobStatus
{
    return _state ? _state->status.load() : JobStatus::Rejected;
}

void JobHandle::cancel()
{
    if (_state)
        _state->cancelled.store(true);
}

namespace
{

    struct Job
    {
        TrackInfo track;
        std::shared_ptr<JobHandle::State> state;
    };

    struct TrackSlot
    {
        TrackId trackId = 0;
        std::optional<Job> queued;
        std::optional<Job> running;
        std::vector<Job> discarded;
        bool cancelled = false;
        std::atomic<bool> finished { false };
        std::jthread thread;
    };

    auto describe(const SchedulingRequest& request) -> std::string
    {
        return std::format("track {} gen {} {} [{:.1f}s, {:.1f}s)",
                           request.trackId,
                           request.generation,
                           tierToString(request.tier),
                           request.range.start,
                           request.range.end);
    }

} // namespace

struct TranscriptionWorker::Impl
{
    SpeechEngine& engine;
    AudioSource& audio;
    WorkerConfig config;
    JobCallback callback;

    mutable std::mutex mutex;
    std::condition_variable_any cv;
    std::map<TrackId, std::unique_ptr<TrackSlot>> slots;
    std::vector<std::unique_ptr<TrackSlot>> retired;
    bool shuttingDown = false;

    std::mutex engineMutex;

    Impl(SpeechEngine& e, AudioSource& a, WorkerConfig c, JobCallback cb):
        engine(e), audio(a), config(std::move(c)), callback(std::move(cb))
    {
    }

    /// @brief Slot thread: takes queued jobs one at a time until the slot is cancelled.
    void run(TrackSlot& slot, const std::stop_token& stopToken)
    {
        while (true)
        {
            auto job = std::optional<Job> {};
            auto discarded = std::vector<Job> {};
            auto exiting = false;
            {
                auto lock = std::unique_lock(mutex);
                cv.wait(lock, stopToken, [&] { return slot.queued || !slot.discarded.empty() || slot.cancelled; });

                discarded = std::exchange(slot.discarded, {});
                if (slot.cancelled || stopToken.stop_requested())
                {
                    if (slot.queued)
                    {
                        slot.queued->state->status = JobStatus::Cancelled;
                        discarded.push_back(std::move(*slot.queued));
                        slot.queued.reset();
                    }
                    exiting = true;
                }
                else if (slot.queued)
                {
                    job = std::move(slot.queued);
                    slot.queued.reset();
                    job->state->status = JobStatus::Running;
                    slot.running = *job;
                }
            }

            for (auto const& dropped: discarded)
                deliverDropped(dropped);

            if (exiting)
                break;
            if (!job)
                continue;

            auto result = job->state->cancelled.load()
                              ? Result<std::vector<TextSpan>>(makeError(ErrorCode::Cancelled, "Job cancelled"))
                              : execute(*job);

            {
                auto lock = std::lock_guard(mutex);
                slot.running.reset();
            }
            cv.notify_all();

            deliver(*job, std::move(result));
        }

        slot.finished.store(true);
    }

    auto execute(const Job& job) -> Result<std::vector<TextSpan>>
    {
        auto const& request = job.state->request;
        auto const startTime = std::chrono::steady_clock::now();

        auto samples = audio.readWindow(job.track, request.range);
        if (!samples)
            return std::unexpected(samples.error());

        auto engineLock = std::unique_lock(engineMutex, std::defer_lock);
        if (config.serializeAcrossTracks)
            engineLock.lock();

        auto spans = engine.transcribe(*samples, config.language, request.tier);
        if (engineLock.owns_lock())
            engineLock.unlock();

        if (!spans)
            return std::unexpected(spans.error());

        for (auto& span: *spans)
        {
            span.start += request.range.start;
            span.end += request.range.start;
        }

        auto const elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - startTime);
        log::debug("Transcribed {} in {} ms ({} span(s))", describe(request), elapsed.count(), spans->size());
        return spans;
    }

    void deliver(const Job& job, Result<std::vector<TextSpan>> result)
    {
        if (job.state->cancelled.load())
        {
            job.state->status = JobStatus::Cancelled;
            callback(job.state->request, makeError(ErrorCode::Cancelled, "Job cancelled"));
            return;
        }

        job.state->status = result ? JobStatus::Completed : JobStatus::Failed;
        callback(job.state->request, std::move(result));
    }

    void deliverDropped(const Job& job)
    {
        if (job.state->status == JobStatus::Superseded)
        {
            log::trace("Superseded {}", describe(job.state->request));
            callback(job.state->request, makeError(ErrorCode::Superseded, "Replaced by a newer request"));
            return;
        }

        job.state->status = JobStatus::Cancelled;
        log::trace("Cancelled {}", describe(job.state->request));
        callback(job.state->request, makeError(ErrorCode::Cancelled, "Track cancelled"));
    }

    /// @brief Joins retired slots whose threads have exited. Requires mutex to be held.
    void reapRetired()
    {
        std::erase_if(retired, [](const std::unique_ptr<TrackSlot>& slot) { return slot->finished.load(); });
    }

    /// @brief Detaches a slot from the live set and asks its thread to exit. Requires mutex to be held.
    void retire(std::unique_ptr<TrackSlot> slot)
    {
        slot->cancelled = true;
        if (slot->running)
            slot->running->state->cancelled = true;
        slot->thread.request_stop();
        retired.push_back(std::move(slot));
    }
};

TranscriptionWorker::TranscriptionWorker(SpeechEngine& engine,
                                         AudioSource& audio,
                                         WorkerConfig config,
                                         JobCallback callback):
    _impl(std::make_unique<Impl>(engine, audio, std::move(config), std::move(callback)))
{
}

TranscriptionWorker::~TranscriptionWorker()
{
    shutdown();
}

auto TranscriptionWorker::submit(const TrackInfo& track, const SchedulingRequest& request) -> JobHandle
{
    auto state = std::make_shared<JobHandle::State>();
    state->request = request;
    auto handle = JobHandle(state);

    auto lock = std::lock_guard(_impl->mutex);
    _impl->reapRetired();

    if (_impl->shuttingDown)
    {
        state->status = JobStatus::Rejected;
        return handle;
    }

    auto& slotPtr = _impl->slots[request.trackId];
    if (!slotPtr)
    {
        slotPtr = std::make_unique<TrackSlot>();
        slotPtr->trackId = request.trackId;
        slotPtr->thread = std::jthread(
            [impl = _impl.get(), slot = slotPtr.get()](const std::stop_token& token) { impl->run(*slot, token); });
    }
    auto& slot = *slotPtr;

    if (slot.queued)
    {
        if (request.generation < slot.queued->state->request.generation)
        {
            state->status = JobStatus::Rejected;
            return handle;
        }
        slot.queued->state->status = JobStatus::Superseded;
        slot.discarded.push_back(std::move(*slot.queued));
        slot.queued.reset();
    }
    else if (slot.running && request.generation <= slot.running->state->request.generation)
    {
        state->status = JobStatus::Rejected;
        return handle;
    }

    slot.queued = Job { .track = track, .state = state };
    _impl->cv.notify_all();
    return handle;
}

void TranscriptionWorker::cancelTrack(TrackId trackId)
{
    auto lock = std::lock_guard(_impl->mutex);
    auto it = _impl->slots.find(trackId);
    if (it == _impl->slots.end())
        return;

    auto slot = std::move(it->second);
    _impl->slots.erase(it);
    _impl->retire(std::move(slot));
    _impl->reapRetired();
    _impl->cv.notify_all();
    log::debug("Cancelled transcription work of track {}", trackId);
}

auto TranscriptionWorker::isBusy(TrackId trackId) const -> bool
{
    auto lock = std::lock_guard(_impl->mutex);
    auto const it = _impl->slots.find(trackId);
    if (it == _impl->slots.end())
        return false;
    return it->second->queued.has_value() || it->second->running.has_value();
}

void TranscriptionWorker::shutdown()
{
    auto slots = std::vector<std::unique_ptr<TrackSlot>> {};
    {
        auto lock = std::lock_guard(_impl->mutex);
        if (_impl->shuttingDown)
            return;
        _impl->shuttingDown = true;

        for (auto& [trackId, slot]: _impl->slots)
            _impl->retire(std::move(slot));
        _impl->slots.clear();
        slots = std::move(_impl->retired);
        _impl->retired.clear();
    }
    _impl->cv.notify_all();

    // Destroying the slots joins their threads.
    slots.clear();
}

} // namespace subplay
