// SPDX-License-Identifier: Apache-2.0
#include "AudioCodec.hpp"

#include <miniaudio.h>

#include <algorithm>
#include <array>
#include <cstring>
#include <format>

namespace voicetutor
{

namespace
{

    /// @brief Seekable in-memory byte sink for ma_encoder (the WAV header is patched at the end).
    struct MemoryStream
    {
        std::vector<std::uint8_t> bytes;
        std::size_t position = 0;
    };

    auto memoryWrite(ma_encoder* encoder, const void* data, size_t bytesToWrite, size_t* bytesWritten) -> ma_result
    {
        auto* stream = static_cast<MemoryStream*>(encoder->pUserData);
        auto const end = stream->position + bytesToWrite;
        if (end > stream->bytes.size())
            stream->bytes.resize(end);
        std::memcpy(stream->bytes.data() + stream->position, data, bytesToWrite);
        stream->position = end;
        if (bytesWritten)
            *bytesWritten = bytesToWrite;
        return MA_SUCCESS;
    }

    auto memorySeek(ma_encoder* encoder, ma_int64 offset, ma_seek_origin origin) -> ma_result
    {
        auto* stream = static_cast<MemoryStream*>(encoder->pUserData);
        auto base = ma_int64 { 0 };
        if (origin == ma_seek_origin_current)
            base = static_cast<ma_int64>(stream->position);
        else if (origin == ma_seek_origin_end)
            base = static_cast<ma_int64>(stream->bytes.size());

        auto const target = base + offset;
        if (target < 0)
            return MA_INVALID_ARGS;
        stream->position = static_cast<std::size_t>(target);
        return MA_SUCCESS;
    }

} // namespace

auto encodeWav(std::span<const float> samples, unsigned sampleRate, unsigned channels)
    -> Result<std::vector<std::uint8_t>>
{
    if (sampleRate == 0 || channels == 0)
        return makeError(ErrorCode::InvalidArgument, "WAV encoding needs a sample rate and channel count");

    auto stream = MemoryStream {};
    auto config = ma_encoder_config_init(ma_encoding_format_wav, ma_format_s16, channels, sampleRate);
    auto encoder = ma_encoder {};

    auto const initResult = ma_encoder_init(memoryWrite, memorySeek, &stream, &config, &encoder);
    if (initResult != MA_SUCCESS)
        return makeError(ErrorCode::AudioError,
                         std::format("Failed to initialize WAV encoder: {}", ma_result_description(initResult)));

    // The encoder converts from its input format, so hand it s16 samples.
    auto pcm = std::vector<ma_int16>(samples.size());
    std::ranges::transform(samples, pcm.begin(), [](float sample) {
        return static_cast<ma_int16>(std::clamp(sample, -1.0f, 1.0f) * 32767.0f);
    });

    auto framesWritten = ma_uint64 { 0 };
    auto const frameCount = static_cast<ma_uint64>(samples.size() / channels);
    auto const writeResult = ma_encoder_write_pcm_frames(&encoder, pcm.data(), frameCount, &framesWritten);
    ma_encoder_uninit(&encoder);

    if (writeResult != MA_SUCCESS || framesWritten != frameCount)
        return makeError(ErrorCode::AudioError,
                         std::format("Failed to encode WAV ({} of {} frames written)", framesWritten, frameCount));

    return std::move(stream.bytes);
}

auto decodeAudio(std::span<const std::uint8_t> data) -> Result<AudioClip>
{
    if (data.empty())
        return makeError(ErrorCode::AudioError, "Cannot decode empty audio");

    // Zero channels and sample rate keep the file's native format.
    auto config = ma_decoder_config_init(ma_format_f32, 0, 0);
    auto decoder = ma_decoder {};
    auto const initResult = ma_decoder_init_memory(data.data(), data.size(), &config, &decoder);
    if (initResult != MA_SUCCESS)
        return makeError(ErrorCode::AudioError,
                         std::format("Unrecognized audio data: {}", ma_result_description(initResult)));

    auto clip = AudioClip {
        .samples = {},
        .sampleRate = decoder.outputSampleRate,
        .channels = decoder.outputChannels,
    };

    constexpr auto ChunkFrames = ma_uint64 { 4096 };
    auto chunk = std::vector<float>(ChunkFrames * clip.channels);
    while (true)
    {
        auto framesRead = ma_uint64 { 0 };
        auto const result = ma_decoder_read_pcm_frames(&decoder, chunk.data(), ChunkFrames, &framesRead);
        if (framesRead > 0)
            clip.samples.insert(clip.samples.end(), chunk.begin(), chunk.begin() + framesRead * clip.channels);
        if (result == MA_AT_END || framesRead == 0)
            break;
        if (result != MA_SUCCESS)
        {
            ma_decoder_uninit(&decoder);
            return makeError(ErrorCode::AudioError,
                             std::format("Failed to decode audio: {}", ma_result_description(result)));
        }
    }

    ma_decoder_uninit(&decoder);
    return clip;
}

} // namespace voicetutor
