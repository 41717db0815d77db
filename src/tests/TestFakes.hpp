// SPDX-License-Identifier: Apache-2.0
#pragma once

// In-process stand-ins for the whisper engine and the audio decoder, so scheduling can be
// tested without models or audio files.

#include <audio/AudioSource.hpp>
#include <speech/SpeechEngine.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace subplay::test
{

/// @brief Polls @p predicate until it holds or @p timeout expires.
inline auto waitUntil(const std::function<bool()>& predicate,
                      std::chrono::milliseconds timeout = std::chrono::seconds(5)) -> bool
{
    auto const deadline = std::chrono::steady_clock::now() + timeout;
    while (!predicate())
    {
        if (std::chrono::steady_clock::now() > deadline)
            return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return true;
}

/// @brief Speech engine returning one span "<tier>" over the first second of every window.
///
/// hold() makes transcribe() block until release(), to observe work while it is running.
class FakeSpeechEngine final: public SpeechEngine
{
  public:
    auto transcribe(std::span<const float> /*samples*/, std::string_view /*language*/, FidelityTier tier)
        -> Result<std::vector<TextSpan>> override
    {
        ++started;
        {
            auto lock = std::unique_lock(_mutex);
            _cv.wait(lock, [this] { return _open; });
        }
        ++calls;

        if (fail)
            return makeError(ErrorCode::TranscriptionError, "fake failure");
        return std::vector<TextSpan> { TextSpan { .start = 0.0, .end = 1.0, .text = std::string(tierToString(tier)) } };
    }

    auto availableTiers() const -> TierSet override { return tiers; }

    void hold()
    {
        auto lock = std::lock_guard(_mutex);
        _open = false;
    }

    void release()
    {
        {
            auto lock = std::lock_guard(_mutex);
            _open = true;
        }
        _cv.notify_all();
    }

    TierSet tiers { FidelityTier::Preview, FidelityTier::Full };
    std::atomic<int> started { 0 };
    std::atomic<int> calls { 0 };
    std::atomic<bool> fail { false };

  private:
    std::mutex _mutex;
    std::condition_variable _cv;
    bool _open = true;
};

/// @brief Audio source producing a short buffer of silence for any window.
class FakeAudioSource final: public AudioSource
{
  public:
    auto readWindow(const TrackInfo& /*track*/, TimeRange window) -> Result<std::vector<float>> override
    {
        {
            auto lock = std::lock_guard(_mutex);
            _windows.push_back(window);
        }
        if (fail)
            return makeError(ErrorCode::DecodeError, "fake decode failure");
        return std::vector<float>(160, 0.0f);
    }

    [[nodiscard]] auto windows() const -> std::vector<TimeRange>
    {
        auto lock = std::lock_guard(_mutex);
        return _windows;
    }

    std::atomic<bool> fail { false };

  private:
    mutable std::mutex _mutex;
    std::vector<TimeRange> _windows;
};

} // namespace subplay::test
