// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <functional>
#include <string>
#include <string_view>

namespace voicetutor
{

/// @brief One request to the conversational-response service.
struct ResponseRequest
{
    /// @brief The user's utterance, possibly bridged with the interrupted previous turn.
    std::string content;

    /// @brief The user interrupted the assistant to say this.
    bool interrupted = false;
};

/// @brief Receives one increment of a streamed response. Returning false stops the stream.
using ResponseDeltaCallback = std::function<bool(std::string_view delta)>;

/// @brief The language-model collaborator producing the tutor's replies.
///
/// request() blocks and runs on a background task.
class ResponseProvider
{
  public:
    virtual ~ResponseProvider() = default;

    /// @brief Returns true if responses arrive as increments through the delta callback.
    [[nodiscard]] virtual auto isStreaming() const -> bool = 0;

    /// @brief Requests a reply.
    /// @param onDelta Called for every increment when streaming; may be empty.
    /// @return The complete reply text, possibly empty.
    [[nodiscard]] virtual auto request(const ResponseRequest& request, const ResponseDeltaCallback& onDelta)
        -> Result<std::string> = 0;

    /// @brief Aborts requests in flight; they fail with Cancelled.
    virtual void abort() = 0;
};

} // namespace voicetutor
