// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Log.hpp>

#include <atomic>
#include <cstdint>
#include <string_view>

namespace voicetutor
{

/// @brief Monotonically increasing cancellation marker.
///
/// Asynchronous work records the token current when it started. Once the
/// manager has advanced past it, the work's result must be dropped before it
/// causes any side effect.
using GenerationToken = std::uint64_t;

/// @brief Issues generation tokens. Advanced only by the conversation thread,
///        checked from any thread.
class GenerationTokenManager
{
  public:
    GenerationTokenManager() = default;

    GenerationTokenManager(const GenerationTokenManager&) = delete;
    GenerationTokenManager& operator=(const GenerationTokenManager&) = delete;

    [[nodiscard]] auto current() const noexcept -> GenerationToken { return _current.load(std::memory_order_acquire); }

    [[nodiscard]] auto isCurrent(GenerationToken token) const noexcept -> bool { return token == current(); }

    /// @brief Invalidates all work tagged with the current token.
    /// @param reason Why the work is cancelled, for the log.
    /// @return The new token.
    auto advance(std::string_view reason) -> GenerationToken
    {
        auto const next = _current.fetch_add(1, std::memory_order_acq_rel) + 1;
        log::debug("Generation {} -> {} ({})", next - 1, next, reason);
        return next;
    }

  private:
    std::atomic<GenerationToken> _current { 0 };
};

} // namespace voicetutor
