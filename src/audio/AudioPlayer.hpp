// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <memory>
#include <optional>
#include <string_view>

namespace subplay
{

/// @brief Plays an audio file through the default playback device using miniaudio.
///
/// Uses PIMPL to isolate miniaudio headers from consumers. Playback is non-blocking: the
/// device callback pulls frames from a decoder, and the playback position is derived from
/// the number of frames it has consumed.
class AudioPlayer
{
  public:
    AudioPlayer();
    ~AudioPlayer();

    AudioPlayer(const AudioPlayer&) = delete;
    AudioPlayer& operator=(const AudioPlayer&) = delete;

    /// @brief Opens a file for playback, closing the previous one. Does not start playing.
    [[nodiscard]] auto open(std::string_view path) -> VoidResult;

    /// @brief Starts playback from the current position.
    [[nodiscard]] auto play() -> VoidResult;

    void pause();
    [[nodiscard]] auto resume() -> VoidResult;
    [[nodiscard]] auto togglePause() -> VoidResult;

    /// @brief Stops playback and closes the file.
    void stop();

    /// @brief Moves the playback position, clamped to the track.
    [[nodiscard]] auto seek(Seconds position) -> VoidResult;

    /// @brief Returns the current playback position in seconds.
    ///
    /// Safe to call from any thread.
    [[nodiscard]] auto position() const -> Seconds;

    /// @brief Returns the track duration, if the decoder knows it.
    [[nodiscard]] auto duration() const -> std::optional<Seconds>;

    [[nodiscard]] auto isPlaying() const -> bool;
    [[nodiscard]] auto isPaused() const -> bool;

    /// @brief Returns true once the decoder ran out of frames.
    [[nodiscard]] auto finished() const -> bool;

    /// @brief Sets the output volume (0.0 to 1.0).
    void setVolume(float volume);

    // Impl must be accessible from the C audio callback
    struct Impl;

  private:
    std::unique_ptr<Impl> _impl;
};

} // namespace subplay
