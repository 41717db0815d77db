// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <vector>

namespace subplay
{

/// @brief Provides the PCM audio of a track window for transcription.
class AudioSource
{
  public:
    virtual ~AudioSource() = default;

    /// @brief Reads [window.start, window.end) of the track as 16 kHz mono float32 PCM.
    ///
    /// Called from transcription worker threads; implementations must be thread-safe.
    /// @return The samples, or an error if the window cannot be decoded or is empty.
    [[nodiscard]] virtual auto readWindow(const TrackInfo& track, TimeRange window) -> Result<std::vector<float>> = 0;
};

} // namespace subplay
