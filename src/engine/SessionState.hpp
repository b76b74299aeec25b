// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Clock.hpp>
#include <core/GenerationToken.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace voicetutor
{

/// @brief Phase of the voice conversation cycle.
enum class Phase : std::uint8_t
{
    Idle,
    Listening,
    Transcribing,
    AwaitingResponse,
    Speaking,
    Error,
};

[[nodiscard]] constexpr auto phaseName(Phase phase) -> std::string_view
{
    switch (phase)
    {
        case Phase::Idle: return "Idle";
        case Phase::Listening: return "Listening";
        case Phase::Transcribing: return "Transcribing";
        case Phase::AwaitingResponse: return "AwaitingResponse";
        case Phase::Speaking: return "Speaking";
        case Phase::Error: return "Error";
    }
    return "Unknown";
}

/// @brief Returns true if the state machine may move from @p from to @p to.
///
/// Any phase may fall into Error or be torn down to Idle; Error is left only
/// through Idle.
[[nodiscard]] constexpr auto isAllowedTransition(Phase from, Phase to) -> bool
{
    if (from == to)
        return false;
    if (to == Phase::Error || to == Phase::Idle)
        return true;

    switch (from)
    {
        case Phase::Idle: return to == Phase::Listening;
        case Phase::Listening: return to == Phase::Transcribing || to == Phase::AwaitingResponse;
        case Phase::Transcribing: return to == Phase::AwaitingResponse || to == Phase::Listening;
        case Phase::AwaitingResponse:
            return to == Phase::Speaking || to == Phase::Listening || to == Phase::Transcribing;
        case Phase::Speaking: return to == Phase::Listening;
        case Phase::Error: return false;
    }
    return false;
}

/// @brief The single record describing the session. Written only by the turn controller.
struct VoiceSessionState
{
    Phase phase = Phase::Idle;
    GenerationToken activeToken = 0;

    /// @brief Muted when false: capture is paused, the phase is kept.
    bool micEnabled = true;

    /// @brief Assistant turns are spoken when true, text-only otherwise.
    bool soundEnabled = true;

    /// @brief Latest interim text of the span in flight.
    std::string pendingInterimText;
};

/// @brief One recorded state-machine step.
struct PhaseTransition
{
    Phase from = Phase::Idle;
    Phase to = Phase::Idle;
    std::string reason;
    TimePoint at {};
};

} // namespace voicetutor
