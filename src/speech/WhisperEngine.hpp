// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <speech/SpeechEngine.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace subplay
{

/// @brief Compute device preference for the whisper models.
enum class ComputeDevice
{
    Auto,
    Gpu,
    Cpu,
};

[[nodiscard]] auto deviceFromString(std::string_view name) -> std::optional<ComputeDevice>;
[[nodiscard]] auto deviceToString(ComputeDevice device) -> std::string_view;

/// @brief Configuration for the whisper.cpp speech engine.
struct WhisperEngineConfig
{
    std::string previewModelPath;
    std::string fullModelPath;
    ComputeDevice device = ComputeDevice::Auto;
    int threads = 4;
    int beamSize = 1;
    int bestOf = 1;
    bool upgradeOnCpu = false; ///< Offer the full tier even without a GPU.
};

/// @brief Speech-to-text using whisper.cpp, with one model per fidelity tier.
///
/// If both tiers name the same model file, a single context serves both.
/// Calls into one context are serialized; different contexts may run concurrently.
class WhisperEngine final: public SpeechEngine
{
  public:
    WhisperEngine();
    ~WhisperEngine() override;

    WhisperEngine(const WhisperEngine&) = delete;
    WhisperEngine& operator=(const WhisperEngine&) = delete;

    /// @brief Loads the configured models. A tier with an empty model path is left unavailable.
    /// @return Success if at least one model was loaded, otherwise a ModelLoadError.
    [[nodiscard]] auto initialize(const WhisperEngineConfig& config) -> VoidResult;

    [[nodiscard]] auto transcribe(std::span<const float> samples, std::string_view language, FidelityTier tier)
        -> Result<std::vector<TextSpan>> override;

    [[nodiscard]] auto availableTiers() const -> TierSet override;

    /// @brief Returns true if the models run on a GPU backend.
    [[nodiscard]] auto usesGpu() const -> bool;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace subplay
