// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioSource.hpp>
#include <core/Error.hpp>
#include <core/Types.hpp>
#include <speech/SpeechEngine.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace subplay
{

/// @brief Lifecycle of a submitted transcription job.
enum class JobStatus : std::uint8_t
{
    Queued,
    Running,
    Completed,
    Failed,
    Superseded, ///< Replaced in the queue by a newer request before it started.
    Cancelled,  ///< Its track was cancelled, or the handle was; no result is committed.
    Rejected,   ///< Not accepted: the track's slot is occupied by work at least as new.
};

/// @brief Called on a worker thread once per accepted job.
///
/// Jobs that did not run to a usable result report ErrorCode::Superseded or ErrorCode::Cancelled.
using JobCallback = std::function<void(const SchedulingRequest& request, Result<std::vector<TextSpan>> result)>;

/// @brief Configuration for the transcription worker.
struct WorkerConfig
{
    std::string language = "auto";

    /// @brief Allow only one speech engine call at a time across all tracks.
    bool serializeAcrossTracks = true;
};

/// @brief Handle to a submitted job, usable to observe or cancel it.
class JobHandle
{
  public:
    struct State;

    JobHandle() = default;
    explicit JobHandle(std::shared_ptr<State> state);

    /// @brief Returns true if the worker accepted the job (it was not rejected).
    [[nodiscard]] auto accepted() const -> bool;

    [[nodiscard]] auto status() const -> JobStatus;

    /// @brief Prevents the job's result from being delivered as a success.
    ///
    /// A job that is already running is not interrupted; its result is reported as cancelled.
    void cancel();

  private:
    std::shared_ptr<State> _state;
};

/// @brief Runs speech engine calls off the playback thread, one at a time per track.
///
/// Every track gets its own slot and thread, so a call that never returns for one track does not
/// hold up another (unless serializeAcrossTracks is set). A slot holds at most one queued request
/// besides the running one:
///  - a newer (or equal) generation replaces a queued request, which is reported as superseded;
///  - an older generation than the queued one is rejected;
///  - while a request runs, only a request of a newer generation may queue behind it.
/// Running calls are never interrupted.
class TranscriptionWorker
{
  public:
    /// @param engine The speech engine, shared by reference with the caller.
    /// @param audio Source of PCM windows.
    /// @param config Worker configuration.
    /// @param callback Receives results on the worker thread.
    TranscriptionWorker(SpeechEngine& engine, AudioSource& audio, WorkerConfig config, JobCallback callback);
    ~TranscriptionWorker();

    TranscriptionWorker(const TranscriptionWorker&) = delete;
    TranscriptionWorker& operator=(const TranscriptionWorker&) = delete;

    /// @brief Submits a request for the given track (non-blocking).
    [[nodiscard]] auto submit(const TrackInfo& track, const SchedulingRequest& request) -> JobHandle;

    /// @brief Drops queued work of a track and marks its running call as cancelled (non-blocking).
    void cancelTrack(TrackId trackId);

    /// @brief Returns true if the track has a queued or running request.
    [[nodiscard]] auto isBusy(TrackId trackId) const -> bool;

    /// @brief Cancels all work and joins the worker threads.
    ///
    /// Blocks until running engine calls return.
    void shutdown();

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace subplay
