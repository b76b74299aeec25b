// SPDX-License-Identifier: Apache-2.0
#include "WhisperRecognizer.hpp"

#include <core/Log.hpp>
#include <core/TextUtils.hpp>

#include <whisper.h>

#include <format>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace voicetutor
{

namespace
{

    constexpr auto WhisperSampleRate = 16000u;

    /// @brief whisper.cpp refuses input shorter than one second.
    constexpr auto MinimumSamples = std::size_t { WhisperSampleRate };

    auto whisperLineBuffer = std::string {};
    auto whisperLogMutex = std::mutex {};

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

    /// @brief Forwards whisper.cpp log output line by line to voicetutor::log.
    void whisperLogCallback(ggml_log_level level, char const* text, void* /*userData*/)
    {
        if (level == GGML_LOG_LEVEL_NONE || text == nullptr)
            return;

        auto const _ = std::lock_guard { whisperLogMutex };
        whisperLineBuffer += text;

        for (auto nl = whisperLineBuffer.find('\n'); nl != std::string::npos; nl = whisperLineBuffer.find('\n'))
        {
            auto const line = text::trim(std::string_view { whisperLineBuffer }.substr(0, nl));
            if (!line.empty())
                log::write(mapGgmlLevel(level).value_or(log::Level::Debug), line);
            whisperLineBuffer.erase(0, nl + 1);
        }
    }

    /// @brief Whisper emits markers like "[BLANK_AUDIO]" or "(music)" for non-speech.
    auto isNonSpeechMarker(std::string_view text) -> bool
    {
        return text.size() >= 2
               && ((text.front() == '[' && text.back() == ']') || (text.front() == '(' && text.back() == ')'));
    }

} // namespace

struct WhisperRecognizer::Impl
{
    whisper_context* ctx = nullptr;
    WhisperConfig config;
    std::mutex mutex;

    ~Impl()
    {
        if (ctx)
            whisper_free(ctx);
    }
};

WhisperRecognizer::WhisperRecognizer(): _impl(std::make_unique<Impl>())
{
}

WhisperRecognizer::~WhisperRecognizer() = default;

auto WhisperRecognizer::initialize(const WhisperConfig& config) -> VoidResult
{
    auto const _ = std::lock_guard { _impl->mutex };
    _impl->config = config;

    if (config.modelPath.empty())
        return makeError(ErrorCode::ModelLoadError, "No whisper model configured");

    whisper_log_set(whisperLogCallback, nullptr);

    auto params = whisper_context_default_params();
    _impl->ctx = whisper_init_from_file_with_params(config.modelPath.c_str(), params);

    if (!_impl->ctx)
        return makeError(ErrorCode::ModelLoadError, std::format("Failed to load whisper model: {}", config.modelPath));

    log::info("Whisper model loaded: {}", config.modelPath);
    return {};
}

auto WhisperRecognizer::isAvailable() const -> bool
{
    return _impl->ctx != nullptr;
}

auto WhisperRecognizer::transcribe(std::span<const float> samples, unsigned sampleRate, bool isFinal)
    -> Result<TranscriptionResult>
{
    auto const _ = std::lock_guard { _impl->mutex };

    if (!_impl->ctx)
        return makeError(ErrorCode::TranscriptionError, "Whisper model not loaded");

    if (sampleRate != WhisperSampleRate)
        return makeError(ErrorCode::InvalidArgument,
                         std::format("Whisper expects {} Hz audio, got {} Hz", WhisperSampleRate, sampleRate));

    auto padded = std::vector<float> {};
    if (samples.size() < MinimumSamples)
    {
        padded.assign(samples.begin(), samples.end());
        padded.resize(MinimumSamples, 0.0f);
        samples = padded;
    }

    auto params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    params.language = _impl->config.language.c_str();
    params.n_threads = _impl->config.threads;
    params.print_progress = false;
    params.print_special = false;
    params.print_realtime = false;
    params.print_timestamps = false;
    params.no_context = true;
    params.no_timestamps = true;
    params.single_segment = !isFinal;

    auto const rc = whisper_full(_impl->ctx, params, samples.data(), static_cast<int>(samples.size()));
    if (rc != 0)
        return makeError(ErrorCode::TranscriptionError, std::format("Whisper transcription failed with code: {}", rc));

    auto result = TranscriptionResult { .isFinal = isFinal, .source = TranscriptSource::Native };
    auto probabilitySum = 0.0f;
    auto tokenCount = 0;
    auto const eot = whisper_token_eot(_impl->ctx);

    auto const nSegments = whisper_full_n_segments(_impl->ctx);
    for (auto i = 0; i < nSegments; ++i)
    {
        if (auto const* segmentText = whisper_full_get_segment_text(_impl->ctx, i))
            result.text += segmentText;

        auto const nTokens = whisper_full_n_tokens(_impl->ctx, i);
        for (auto j = 0; j < nTokens; ++j)
        {
            if (whisper_full_get_token_id(_impl->ctx, i, j) >= eot)
                continue;
            probabilitySum += whisper_full_get_token_p(_impl->ctx, i, j);
            ++tokenCount;
        }
    }

    result.text = std::string(text::trim(result.text));
    if (isNonSpeechMarker(result.text))
        result.text.clear();
    result.confidence = tokenCount > 0 ? probabilitySum / static_cast<float>(tokenCount) : 0.0f;

    return result;
}

} // namespace voicetutor
