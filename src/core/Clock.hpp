// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>

namespace voicetutor
{

using SteadyClock = std::chrono::steady_clock;
using TimePoint = SteadyClock::time_point;
using Millis = std::chrono::milliseconds;

/// @brief Source of the current time for timing decisions (debounce, cooldown, promotion).
///
/// Audio frames carry their own capture timestamps; this clock covers decisions
/// that are not tied to a frame, such as the echo cooldown after playback ends.
class Clock
{
  public:
    virtual ~Clock() = default;

    [[nodiscard]] virtual auto now() const -> TimePoint = 0;
};

/// @brief Clock backed by std::chrono::steady_clock.
class SystemClock final: public Clock
{
  public:
    [[nodiscard]] auto now() const -> TimePoint override { return SteadyClock::now(); }
};

/// @brief Returns the number of whole milliseconds between two time points.
[[nodiscard]] inline auto millisBetween(TimePoint from, TimePoint to) -> Millis
{
    return std::chrono::duration_cast<Millis>(to - from);
}

} // namespace voicetutor
