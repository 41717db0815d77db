// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioSource.hpp>
#include <core/Error.hpp>
#include <core/Types.hpp>

#include <string_view>
#include <vector>

namespace subplay
{

/// @brief Decodes track windows straight from the audio file with miniaudio.
///
/// Every call opens its own decoder, so concurrent calls from several worker threads are safe.
/// The decoder converts to 16 kHz mono float32 on the fly.
class DecoderAudioSource final: public AudioSource
{
  public:
    [[nodiscard]] auto readWindow(const TrackInfo& track, TimeRange window) -> Result<std::vector<float>> override;
};

/// @brief Determines the playing time of an audio file.
/// @return The duration in seconds, an AudioError if the file cannot be opened,
///         or a DecodeError if its length is unknown.
[[nodiscard]] auto probeDuration(std::string_view path) -> Result<Seconds>;

} // namespace subplay
