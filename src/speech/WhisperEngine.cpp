// SPDX-License-Identifier: Apache-2.0
#include "WhisperEngine.hpp"

#include <core/Log.hpp>

#include <whisper.h>

#include <array>
#include <format>
#include <mutex>
#include <optional>
#include <string>

namespace subplay
{

namespace
{

    /// @brief Line buffer for whisper.cpp log continuation messages.
    auto whisperLineBuffer = std::string {};
    auto whisperLineMutex = std::mutex {};

    auto mapGgmlLevel(ggml_log_level level) -> std::optional<log::Level>
    {
        switch (level)
        {
            case GGML_LOG_LEVEL_ERROR: return log::Level::Error;
            case GGML_LOG_LEVEL_WARN: return log::Level::Warning;
            case GGML_LOG_LEVEL_INFO: return log::Level::Debug;
            case GGML_LOG_LEVEL_DEBUG: return log::Level::Trace;
            default: return std::nullopt;
        }
    }

    /// @brief Forwards whisper.cpp/ggml log output to subplay::log, one complete line at a time.
    ///
    /// Model loading logs at info level a lot, so it is demoted to debug.
    void whisperLogCallback(ggml_log_level level, char const* text, void* /*userData*/)
    {
        if (level == GGML_LOG_LEVEL_NONE || text == nullptr)
            return;

        auto lock = std::lock_guard(whisperLineMutex);
        whisperLineBuffer += std::string_view { text };

        while (true)
        {
            auto const nlPos = whisperLineBuffer.find('\n');
            if (nlPos == std::string::npos)
                break;

            auto line = whisperLineBuffer.substr(0, nlPos);
            auto const end = line.find_last_not_of(" \t\r");
            if (end != std::string::npos)
                line = line.substr(0, end + 1);

            if (!line.empty() && line.find_first_not_of(" \t\r") != std::string::npos)
                log::write(mapGgmlLevel(level).value_or(log::Level::Debug), line);

            whisperLineBuffer.erase(0, nlPos + 1);
        }
    }

    auto trim(std::string_view text) -> std::string
    {
        auto const start = text.find_first_not_of(" \t\n\r");
        if (start == std::string_view::npos)
            return {};
        auto const end = text.find_last_not_of(" \t\n\r");
        return std::string(text.substr(start, end - start + 1));
    }

    /// @brief Whisper emits bracketed markers for non-speech audio.
    auto isHallucinationMarker(std::string_view text) -> bool
    {
        static constexpr auto Patterns = std::array {
            std::string_view { "[BLANK_AUDIO]" }, std::string_view { "(blank audio)" },
            std::string_view { "[SOUND]" },       std::string_view { "[MUSIC]" },
            std::string_view { "[Music]" },       std::string_view { "(music)" },
            std::string_view { "[NOISE]" },       std::string_view { "[silence]" },
        };
        for (auto const& pattern: Patterns)
            if (text == pattern)
                return true;
        return false;
    }

    struct Model
    {
        std::string path;
        whisper_context* ctx = nullptr;
        std::mutex mutex;

        ~Model()
        {
            if (ctx)
                whisper_free(ctx);
        }
    };

} // namespace

auto deviceFromString(std::string_view name) -> std::optional<ComputeDevice>
{
    if (name == "auto")
        return ComputeDevice::Auto;
    if (name == "gpu")
        return ComputeDevice::Gpu;
    if (name == "cpu")
        return ComputeDevice::Cpu;
    return std::nullopt;
}

auto deviceToString(ComputeDevice device) -> std::string_view
{
    switch (device)
    {
        case ComputeDevice::Auto: return "auto";
        case ComputeDevice::Gpu: return "gpu";
        case ComputeDevice::Cpu: return "cpu";
    }
    return "auto";
}

struct WhisperEngine::Impl
{
    WhisperEngineConfig config;
    std::shared_ptr<Model> preview;
    std::shared_ptr<Model> full;
    bool gpu = false;
    bool gpuFallbackReported = false;

    auto load(const std::string& path) -> Result<std::shared_ptr<Model>>
    {
        auto model = std::make_shared<Model>();
        model->path = path;

        auto params = whisper_context_default_params();
        if (config.device != ComputeDevice::Cpu)
        {
            params.use_gpu = true;
            model->ctx = whisper_init_from_file_with_params(path.c_str(), params);
            if (model->ctx)
                gpu = true;
            else if (!gpuFallbackReported)
            {
                log::warning("GPU context for {} could not be created; falling back to CPU", path);
                gpuFallbackReported = true;
            }
        }

        if (!model->ctx)
        {
            params.use_gpu = false;
            model->ctx = whisper_init_from_file_with_params(path.c_str(), params);
            if (model->ctx)
                gpu = false;
        }

        if (!model->ctx)
            return makeError(ErrorCode::ModelLoadError, std::format("Failed to load whisper model: {}", path));

        log::info("Whisper model loaded: {} ({})", path, gpu ? "gpu" : "cpu");
        return model;
    }

    [[nodiscard]] auto modelFor(FidelityTier tier) const -> Model*
    {
        return tier == FidelityTier::Preview ? preview.get() : full.get();
    }
};

WhisperEngine::WhisperEngine(): _impl(std::make_unique<Impl>())
{
}

WhisperEngine::~WhisperEngine() = default;

auto WhisperEngine::initialize(const WhisperEngineConfig& config) -> VoidResult
{
    _impl->config = config;

    whisper_log_set(whisperLogCallback, nullptr);

    if (!config.previewModelPath.empty())
    {
        auto model = _impl->load(config.previewModelPath);
        if (model)
            _impl->preview = std::move(*model);
        else
            log::warning("Preview tier unavailable: {}", model.error());
    }

    if (!config.fullModelPath.empty())
    {
        if (_impl->preview && config.fullModelPath == config.previewModelPath)
            _impl->full = _impl->preview;
        else if (auto model = _impl->load(config.fullModelPath))
            _impl->full = std::move(*model);
        else
            log::warning("Full tier unavailable: {}", model.error());
    }

    if (!_impl->preview && !_impl->full)
        return makeError(ErrorCode::ModelLoadError, "No whisper model could be loaded");

    return {};
}

auto WhisperEngine::transcribe(std::span<const float> samples, std::string_view language, FidelityTier tier)
    -> Result<std::vector<TextSpan>>
{
    auto* model = _impl->modelFor(tier);
    if (!model)
        return makeError(ErrorCode::DeviceUnavailable,
                         std::format("No whisper model loaded for the {} tier", tierToString(tier)));

    if (samples.empty())
        return makeError(ErrorCode::InvalidArgument, "No audio samples to transcribe");

    auto const& config = _impl->config;
    auto const beamSearch = config.beamSize > 1;
    auto const languageStr = std::string(language.empty() ? std::string_view { "auto" } : language);

    auto params = whisper_full_default_params(beamSearch ? WHISPER_SAMPLING_BEAM_SEARCH : WHISPER_SAMPLING_GREEDY);
    params.language = languageStr.c_str();
    params.n_threads = config.threads;
    params.print_progress = false;
    params.print_special = false;
    params.print_realtime = false;
    params.print_timestamps = false;
    params.no_context = true;
    params.single_segment = false;
    if (beamSearch)
        params.beam_search.beam_size = config.beamSize;
    else
        params.greedy.best_of = config.bestOf;

    auto lock = std::lock_guard(model->mutex);

    auto const result = whisper_full(model->ctx, params, samples.data(), static_cast<int>(samples.size()));
    if (result != 0)
        return makeError(ErrorCode::TranscriptionError,
                         std::format("Whisper transcription failed with code: {}", result));

    auto const nSegments = whisper_full_n_segments(model->ctx);
    auto spans = std::vector<TextSpan> {};
    spans.reserve(static_cast<std::size_t>(nSegments));

    for (auto i = 0; i < nSegments; ++i)
    {
        auto const* segmentText = whisper_full_get_segment_text(model->ctx, i);
        if (!segmentText)
            continue;

        auto text = trim(segmentText);
        if (text.empty() || isHallucinationMarker(text))
            continue;

        // Segment timestamps are in centiseconds.
        spans.push_back(TextSpan {
            .start = static_cast<Seconds>(whisper_full_get_segment_t0(model->ctx, i)) / 100.0,
            .end = static_cast<Seconds>(whisper_full_get_segment_t1(model->ctx, i)) / 100.0,
            .text = std::move(text),
        });
    }

    return spans;
}

auto WhisperEngine::availableTiers() const -> TierSet
{
    auto tiers = TierSet {};
    if (_impl->preview)
        tiers.insert(FidelityTier::Preview);
    if (_impl->full && (_impl->gpu || _impl->config.upgradeOnCpu || !_impl->preview))
        tiers.insert(FidelityTier::Full);
    return tiers;
}

auto WhisperEngine::usesGpu() const -> bool
{
    return _impl->gpu;
}

} // namespace subplay
