// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <span>
#include <string_view>
#include <vector>

namespace subplay
{

/// @brief Sample rate of the PCM audio handed to a SpeechEngine (mono float32).
inline constexpr auto SpeechSampleRate = 16000u;

/// @brief Abstract interface of a speech-to-text model.
///
/// transcribe() must behave as a pure function of its inputs: implementations may be called
/// from several worker threads and must not leak state from one call into the next.
class SpeechEngine
{
  public:
    virtual ~SpeechEngine() = default;

    /// @brief Transcribes one window of audio.
    /// @param samples Float32 PCM at SpeechSampleRate, mono.
    /// @param language Language hint ("auto" to detect).
    /// @param tier Fidelity tier to transcribe at.
    /// @return Timed text spans with offsets relative to the first sample, or an error.
    [[nodiscard]] virtual auto transcribe(std::span<const float> samples,
                                          std::string_view language,
                                          FidelityTier tier) -> Result<std::vector<TextSpan>> = 0;

    /// @brief Returns the tiers this engine can serve on the current compute device.
    [[nodiscard]] virtual auto availableTiers() const -> TierSet = 0;
};

} // namespace subplay
