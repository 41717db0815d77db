// SPDX-License-Identifier: Apache-2.0
#include "DecoderAudioSource.hpp"

#include <core/Log.hpp>
#include <speech/SpeechEngine.hpp>

#include <miniaudio.h>

#include <cmath>
#include <format>
#include <string>

namespace subplay
{

namespace
{

    /// @brief Owns an initialized ma_decoder.
    class Decoder
    {
      public:
        Decoder() = default;
        ~Decoder()
        {
            if (_initialized)
                ma_decoder_uninit(&_decoder);
        }

        Decoder(const Decoder&) = delete;
        Decoder& operator=(const Decoder&) = delete;

        [[nodiscard]] auto open(const std::string& path, ma_uint32 sampleRate) -> VoidResult
        {
            auto config = ma_decoder_config_init(ma_format_f32, 1, sampleRate);
            auto const result = ma_decoder_init_file(path.c_str(), &config, &_decoder);
            if (result != MA_SUCCESS)
                return makeError(ErrorCode::AudioError,
                                 std::format("Cannot open audio file {}: {}", path, static_cast<int>(result)));
            _initialized = true;
            return {};
        }

        [[nodiscard]] auto get() -> ma_decoder* { return &_decoder; }

      private:
        ma_decoder _decoder {};
        bool _initialized = false;
    };

} // namespace

auto DecoderAudioSource::readWindow(const TrackInfo& track, TimeRange window) -> Result<std::vector<float>>
{
    if (window.empty() || window.start < 0.0)
        return makeError(ErrorCode::InvalidArgument,
                         std::format("Invalid audio window [{:.2f}s, {:.2f}s)", window.start, window.end));

    auto decoder = Decoder {};
    if (auto result = decoder.open(track.path, SpeechSampleRate); !result)
        return std::unexpected(result.error());

    auto const startFrame = static_cast<ma_uint64>(std::floor(window.start * SpeechSampleRate));
    auto const frameCount = static_cast<ma_uint64>(std::ceil(window.length() * SpeechSampleRate));

    if (ma_decoder_seek_to_pcm_frame(decoder.get(), startFrame) != MA_SUCCESS)
        return makeError(ErrorCode::DecodeError,
                         std::format("Cannot seek to {:.2f}s in {}", window.start, track.path));

    auto samples = std::vector<float>(static_cast<std::size_t>(frameCount));
    auto framesRead = ma_uint64 { 0 };
    auto const result = ma_decoder_read_pcm_frames(decoder.get(), samples.data(), frameCount, &framesRead);
    if (result != MA_SUCCESS && result != MA_AT_END)
        return makeError(ErrorCode::DecodeError,
                         std::format("Failed to decode {}: {}", track.path, static_cast<int>(result)));

    // Windows reaching past the end of the file are truncated.
    samples.resize(static_cast<std::size_t>(framesRead));
    if (samples.empty())
        return makeError(ErrorCode::DecodeError,
                         std::format("No audio in [{:.2f}s, {:.2f}s) of {}", window.start, window.end, track.path));

    log::trace("Decoded {} frame(s) of {}", framesRead, track.path);
    return samples;
}

auto probeDuration(std::string_view path) -> Result<Seconds>
{
    auto decoder = Decoder {};
    // Native sample rate: no resampler is involved in the length query.
    if (auto result = decoder.open(std::string(path), 0); !result)
        return std::unexpected(result.error());

    auto frames = ma_uint64 { 0 };
    if (ma_decoder_get_length_in_pcm_frames(decoder.get(), &frames) != MA_SUCCESS || frames == 0)
        return makeError(ErrorCode::DecodeError, std::format("Unknown duration of {}", path));

    auto const sampleRate = decoder.get()->outputSampleRate;
    if (sampleRate == 0)
        return makeError(ErrorCode::DecodeError, std::format("Unknown sample rate of {}", path));

    return static_cast<Seconds>(frames) / static_cast<Seconds>(sampleRate);
}

} // namespace subplay
