// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioTypes.hpp>

#include <span>

namespace voicetutor
{

/// @brief Root-mean-square amplitude of the samples, as a percentage of full scale.
[[nodiscard]] auto rmsPercent(std::span<const float> samples) -> float;

/// @brief Largest absolute sample value, as a percentage of full scale.
[[nodiscard]] auto peakPercent(std::span<const float> samples) -> float;

/// @brief Computes an RMS envelope with one value per @p frameDuration of audio.
/// @param samples Mono or interleaved samples.
/// @param sampleRate Sample rate in Hz.
/// @param channels Channel count of the interleaved samples.
/// @param start Time the first sample is (or was) audible.
/// @param frameDuration Envelope resolution.
[[nodiscard]] auto computeEnvelope(std::span<const float> samples,
                                   unsigned sampleRate,
                                   unsigned channels,
                                   TimePoint start,
                                   Millis frameDuration) -> LoudnessEnvelope;

/// @brief Envelope of captured frames, one value per frame.
[[nodiscard]] auto envelopeOf(std::span<const AudioFrame> frames) -> LoudnessEnvelope;

/// @brief Pearson correlation of two equally long series; 0 when either is flat.
[[nodiscard]] auto correlation(std::span<const float> a, std::span<const float> b) -> float;

} // namespace voicetutor
