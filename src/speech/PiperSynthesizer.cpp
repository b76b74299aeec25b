// SPDX-License-Identifier: Apache-2.0
#include "PiperSynthesizer.hpp"

#include <core/Log.hpp>

#include <format>
#include <mutex>
#include <string>

extern "C"
{
#include <piper.h>
}

namespace voicetutor
{

namespace
{

    /// @brief Piper output format: float32 PCM, 22050 Hz, mono.
    constexpr auto PiperSampleRate = 22050u;

} // namespace

struct PiperSynthesizer::Impl
{
    PiperConfig config;
    piper_synthesizer* synth = nullptr;
    std::mutex mutex;

    ~Impl()
    {
        if (synth)
            piper_free(synth);
    }
};

PiperSynthesizer::PiperSynthesizer(): _impl(std::make_unique<Impl>())
{
}

PiperSynthesizer::~PiperSynthesizer() = default;

auto PiperSynthesizer::initialize(const PiperConfig& config) -> VoidResult
{
    auto const _ = std::lock_guard { _impl->mutex };
    _impl->config = config;

    auto const configPath = config.modelPath + ".json";
    auto const espeakData =
        config.espeakDataPath.empty() ? std::string(VOICETUTOR_ESPEAK_DATA_DIR) : config.espeakDataPath;

    _impl->synth = piper_create(config.modelPath.c_str(), configPath.c_str(), espeakData.c_str());
    if (!_impl->synth)
        return makeError(ErrorCode::ModelLoadError,
                         std::format("Failed to create piper synthesizer (model: {}, config: {}, espeak: {})",
                                     config.modelPath,
                                     configPath,
                                     espeakData));

    log::info("Piper voice loaded (model: {}, espeak: {})", config.modelPath, espeakData);
    return {};
}

auto PiperSynthesizer::isAvailable() const -> bool
{
    return _impl->synth != nullptr;
}

auto PiperSynthesizer::synthesize(std::string_view text) -> Result<AudioClip>
{
    auto const _ = std::lock_guard { _impl->mutex };

    if (!_impl->synth)
        return makeError(ErrorCode::SynthesisError, "Piper voice not loaded");

    auto const input = std::string(text);
    auto options = piper_default_synthesize_options(_impl->synth);
    if (_impl->config.speed > 0.0f)
        options.length_scale /= _impl->config.speed;

    if (auto const rc = piper_synthesize_start(_impl->synth, input.c_str(), &options); rc != 0)
        return makeError(ErrorCode::SynthesisError, std::format("piper_synthesize_start failed ({})", rc));

    auto clip = AudioClip { .sampleRate = PiperSampleRate, .channels = 1 };
    auto chunk = piper_audio_chunk {};
    while (true)
    {
        auto const rc = piper_synthesize_next(_impl->synth, &chunk);
        if (rc == PIPER_DONE)
            break;
        if (rc < 0)
            return makeError(ErrorCode::SynthesisError, std::format("piper_synthesize_next failed ({})", rc));
        clip.samples.insert(clip.samples.end(), chunk.samples, chunk.samples + chunk.num_samples);
    }

    return clip;
}

} // namespace voicetutor
