// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <speech/Synthesizer.hpp>

#include <memory>
#include <string>

namespace voicetutor
{

/// @brief Configuration for on-device piper synthesis.
struct PiperConfig
{
    /// @brief Path to the piper voice model (.onnx file); its config is expected next to it with ".json" appended.
    std::string modelPath;

    /// @brief Path to the espeak-ng-data directory (defaults to the one piper was built with).
    std::string espeakDataPath;

    /// @brief Speech rate; values below 1 speak slower.
    float speed = 0.95f;
};

/// @brief Offline text-to-speech using the piper library.
class PiperSynthesizer final: public Synthesizer
{
  public:
    PiperSynthesizer();
    ~PiperSynthesizer() override;

    PiperSynthesizer(const PiperSynthesizer&) = delete;
    PiperSynthesizer& operator=(const PiperSynthesizer&) = delete;

    /// @brief Loads the voice model.
    /// @return ModelLoadError if piper cannot be created.
    [[nodiscard]] auto initialize(const PiperConfig& config) -> VoidResult;

    [[nodiscard]] auto name() const -> std::string_view override { return "piper"; }
    [[nodiscard]] auto isAvailable() const -> bool override;
    [[nodiscard]] auto synthesize(std::string_view text) -> Result<AudioClip> override;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace voicetutor
