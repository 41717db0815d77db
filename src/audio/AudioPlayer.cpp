// SPDX-License-Identifier: Apache-2.0
#include "AudioPlayer.hpp"

#include <core/Log.hpp>

#include <miniaudio.h>

#include <algorithm>
#include <atomic>
#include <format>
#include <mutex>
#include <string>

namespace subplay
{

struct AudioPlayer::Impl
{
    ma_decoder decoder {};
    ma_device device {};
    bool decoderInitialized = false;
    bool deviceInitialized = false;

    // Decoder state, shared with the device callback.
    std::mutex mutex;
    ma_uint64 cursor = 0;
    ma_uint32 sampleRate = 0;
    std::optional<Seconds> duration;

    std::atomic<bool> playing { false };
    std::atomic<bool> paused { false };
    std::atomic<bool> finished { false };
    float volume = 1.0f;

    void close()
    {
        if (deviceInitialized)
        {
            ma_device_uninit(&device);
            deviceInitialized = false;
        }
        if (decoderInitialized)
        {
            ma_decoder_uninit(&decoder);
            decoderInitialized = false;
        }
        playing = false;
        paused = false;
        finished = false;
        cursor = 0;
        duration.reset();
    }
};

namespace
{

    void playbackDataCallback(ma_device* device, void* output, const void* /*input*/, ma_uint32 frameCount)
    {
        auto* impl = static_cast<AudioPlayer::Impl*>(device->pUserData);
        auto* out = static_cast<float*>(output);
        auto const channels = device->playback.channels;

        auto lock = std::lock_guard(impl->mutex);
        auto framesRead = ma_uint64 { 0 };
        if (!impl->finished.load(std::memory_order_relaxed))
        {
            auto const result = ma_decoder_read_pcm_frames(&impl->decoder, out, frameCount, &framesRead);
            impl->cursor += framesRead;
            if (result != MA_SUCCESS || framesRead < frameCount)
                impl->finished.store(true, std::memory_order_relaxed);
        }

        // Zero-fill any remaining output frames
        auto const samplesRead = static_cast<std::size_t>(framesRead) * channels;
        auto const totalSamples = static_cast<std::size_t>(frameCount) * channels;
        if (samplesRead < totalSamples)
            std::fill_n(out + samplesRead, totalSamples - samplesRead, 0.0f);
    }

} // namespace

AudioPlayer::AudioPlayer(): _impl(std::make_unique<Impl>())
{
}

AudioPlayer::~AudioPlayer()
{
    stop();
}

auto AudioPlayer::open(std::string_view path) -> VoidResult
{
    stop();

    auto const pathStr = std::string(path);
    auto decoderConfig = ma_decoder_config_init(ma_format_f32, 0, 0);
    auto const decoderResult = ma_decoder_init_file(pathStr.c_str(), &decoderConfig, &_impl->decoder);
    if (decoderResult != MA_SUCCESS)
        return makeError(ErrorCode::AudioError,
                         std::format("Cannot open audio file {}: {}", path, static_cast<int>(decoderResult)));
    _impl->decoderInitialized = true;
    _impl->sampleRate = _impl->decoder.outputSampleRate;

    auto frames = ma_uint64 { 0 };
    if (ma_decoder_get_length_in_pcm_frames(&_impl->decoder, &frames) == MA_SUCCESS && frames > 0
        && _impl->sampleRate > 0)
        _impl->duration = static_cast<Seconds>(frames) / static_cast<Seconds>(_impl->sampleRate);

    auto config = ma_device_config_init(ma_device_type_playback);
    config.playback.format = ma_format_f32;
    config.playback.channels = _impl->decoder.outputChannels;
    config.sampleRate = _impl->sampleRate;
    config.dataCallback = playbackDataCallback;
    config.pUserData = _impl.get();

    auto const deviceResult = ma_device_init(nullptr, &config, &_impl->device);
    if (deviceResult != MA_SUCCESS)
    {
        _impl->close();
        return makeError(ErrorCode::AudioError,
                         std::format("Failed to initialize playback device: {}", static_cast<int>(deviceResult)));
    }
    _impl->deviceInitialized = true;
    ma_device_set_master_volume(&_impl->device, _impl->volume);

    log::debug("Opened {} ({}Hz, {} channel(s))", path, _impl->sampleRate, _impl->decoder.outputChannels);
    return {};
}

auto AudioPlayer::play() -> VoidResult
{
    if (!_impl->deviceInitialized)
        return makeError(ErrorCode::AudioError, "No audio file open");

    auto const result = ma_device_start(&_impl->device);
    if (result != MA_SUCCESS)
        return makeError(ErrorCode::AudioError, std::format("Failed to start playback: {}", static_cast<int>(result)));

    _impl->playing = true;
    _impl->paused = false;
    return {};
}

void AudioPlayer::pause()
{
    if (!_impl->playing || _impl->paused)
        return;
    ma_device_stop(&_impl->device);
    _impl->paused = true;
}

auto AudioPlayer::resume() -> VoidResult
{
    if (!_impl->paused)
        return {};
    return play();
}

auto AudioPlayer::togglePause() -> VoidResult
{
    if (_impl->paused)
        return resume();
    pause();
    return {};
}

void AudioPlayer::stop()
{
    if (_impl->deviceInitialized)
        ma_device_stop(&_impl->device);
    _impl->close();
}

auto AudioPlayer::seek(Seconds position) -> VoidResult
{
    if (!_impl->decoderInitialized)
        return makeError(ErrorCode::AudioError, "No audio file open");

    auto target = std::max(position, 0.0);
    if (_impl->duration)
        target = std::min(target, *_impl->duration);

    auto const frame = static_cast<ma_uint64>(target * _impl->sampleRate);
    auto lock = std::lock_guard(_impl->mutex);
    auto const result = ma_decoder_seek_to_pcm_frame(&_impl->decoder, frame);
    if (result != MA_SUCCESS)
        return makeError(ErrorCode::AudioError, std::format("Seek to {:.1f}s failed: {}", target, static_cast<int>(result)));

    _impl->cursor = frame;
    _impl->finished = false;
    return {};
}

auto AudioPlayer::position() const -> Seconds
{
    auto lock = std::lock_guard(_impl->mutex);
    if (_impl->sampleRate == 0)
        return 0.0;
    return static_cast<Seconds>(_impl->cursor) / static_cast<Seconds>(_impl->sampleRate);
}

auto AudioPlayer::duration() const -> std::optional<Seconds>
{
    return _impl->duration;
}

auto AudioPlayer::isPlaying() const -> bool
{
    return _impl->playing && !_impl->paused;
}

auto AudioPlayer::isPaused() const -> bool
{
    return _impl->paused;
}

auto AudioPlayer::finished() const -> bool
{
    return _impl->finished;
}

void AudioPlayer::setVolume(float volume)
{
    _impl->volume = std::clamp(volume, 0.0f, 1.0f);
    if (_impl->deviceInitialized)
        ma_device_set_master_volume(&_impl->device, _impl->volume);
}

} // namespace subplay
