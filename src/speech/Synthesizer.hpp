// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioTypes.hpp>
#include <core/Error.hpp>

#include <functional>
#include <string_view>

namespace voicetutor
{

/// @brief A text-to-speech backend. synthesize() blocks and runs on a background task.
class Synthesizer
{
  public:
    virtual ~Synthesizer() = default;

    [[nodiscard]] virtual auto name() const -> std::string_view = 0;

    [[nodiscard]] virtual auto isAvailable() const -> bool = 0;

    /// @brief Renders @p text into a playable clip.
    [[nodiscard]] virtual auto synthesize(std::string_view text) -> Result<AudioClip> = 0;
};

/// @brief Runs synthesize() with up to @p retries additional attempts on retryable failures.
/// @param isCancelled Checked before every attempt; a cancelled synthesis fails with Cancelled.
[[nodiscard]] auto synthesizeWithRetries(Synthesizer& synthesizer,
                                         std::string_view text,
                                         int retries,
                                         const std::function<bool()>& isCancelled) -> Result<AudioClip>;

} // namespace voicetutor
