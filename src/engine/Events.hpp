// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioTypes.hpp>
#include <core/Error.hpp>
#include <core/GenerationToken.hpp>
#include <llm/ResponseRequester.hpp>
#include <speech/TranscriptionService.hpp>

#include <cstdint>
#include <functional>
#include <string>
#include <variant>

namespace voicetutor
{

// Device and background events

/// @brief A frame arrived from the capture device.
struct FrameCaptured
{
    AudioFrame frame;
};

/// @brief The capture stream failed after it was opened.
struct CaptureFailed
{
    Error error;
};

/// @brief The output device finished playing a segment.
struct SegmentDrained
{
    std::uint64_t segmentId = 0;
};

/// @brief A recognizer call finished.
struct RecognitionCompleted
{
    RecognitionOutcome outcome;
};

/// @brief One increment of a streamed model reply.
struct ResponseDelta
{
    GenerationToken token = 0;
    std::string text;
};

/// @brief A model request finished (after its retries).
struct ResponseCompleted
{
    GenerationToken token = 0;
    Result<ResponseOutcome> outcome;
};

/// @brief Audio for one sentence of the assistant turn is ready, or could not be made.
struct SynthesisCompleted
{
    GenerationToken token = 0;

    /// @brief Position of the sentence within its assistant turn.
    std::uint64_t index = 0;

    /// @brief The sentence as written in the reply.
    std::string text;

    /// @brief The sentence as it was synthesized, after math conversion.
    std::string speech;
    Result<AudioClip> clip;
};

// Host commands

struct StartSession
{
};

struct EndSession
{
};

/// @brief Leaves the Error phase (or any other) for Idle.
struct ResetSession
{
};

struct SetMicEnabled
{
    bool enabled = true;
};

struct SetSoundEnabled
{
    bool enabled = true;
};

/// @brief Everything the conversation thread reacts to.
using VoiceEvent = std::variant<FrameCaptured,
                                CaptureFailed,
                                SegmentDrained,
                                RecognitionCompleted,
                                ResponseDelta,
                                ResponseCompleted,
                                SynthesisCompleted,
                                StartSession,
                                EndSession,
                                ResetSession,
                                SetMicEnabled,
                                SetSoundEnabled>;

/// @brief Hands an event to the conversation thread. Callable from any thread.
using EventPoster = std::function<void(VoiceEvent)>;

} // namespace voicetutor
