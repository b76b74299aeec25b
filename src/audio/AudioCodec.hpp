// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioTypes.hpp>
#include <core/Error.hpp>

#include <cstdint>
#include <span>
#include <vector>

namespace voicetutor
{

/// @brief Encodes float32 samples as a 16-bit PCM WAV file in memory.
[[nodiscard]] auto encodeWav(std::span<const float> samples, unsigned sampleRate, unsigned channels)
    -> Result<std::vector<std::uint8_t>>;

/// @brief Decodes an encoded audio file (WAV, MP3 or FLAC) into float32 samples.
///
/// The output keeps the file's channel count and sample rate.
[[nodiscard]] auto decodeAudio(std::span<const std::uint8_t> data) -> Result<AudioClip>;

} // namespace voicetutor
