// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Clock.hpp>
#include <core/Error.hpp>
#include <llm/ResponseProvider.hpp>

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace voicetutor
{

/// @brief Retry and fallback behaviour of model requests.
struct ResponsePolicy
{
    /// @brief Additional attempts after the first, shared by failures and empty replies.
    int maxRetries = 3;

    /// @brief Pause before retrying a network or timeout failure.
    Millis retryBackoff { 1000 };

    /// @brief Base of the exponential pause before retrying an empty reply.
    Millis emptyRetryBase { 500 };

    /// @brief Prefixes put in front of the utterance on the n-th retry of an empty reply.
    std::vector<std::string> rephrasings {
        "Пожалуйста, объясни:", "Расскажи мне про:", "Помоги мне с:", "Я хочу узнать:", "Объясни, пожалуйста:",
    };

    /// @brief Prefix used once the list above is exhausted.
    std::string defaultRephrasing = "Скажи мне:";

    /// @brief Spoken when every attempt came back empty.
    std::string emptyFallback = "Извините, я не расслышала. Повторите, пожалуйста.";

    /// @brief Spoken when the service could not be reached.
    std::string networkFallback = "Извините, произошла ошибка связи. Попробуйте еще раз.";
};

/// @brief The reply finally used for an assistant turn.
struct ResponseOutcome
{
    std::string text;

    /// @brief @c text is a fallback utterance, not a model reply.
    bool fallback = false;

    /// @brief The error that led to the fallback (or that cut a streamed reply short).
    std::optional<Error> error;

    int attempts = 0;
};

/// @brief Pauses the calling background task.
using Sleeper = std::function<void(Millis)>;

/// @brief Wraps a ResponseProvider with the retry, rephrasing and fallback policy.
///
/// Network and timeout failures are retried after a fixed pause. Empty
/// replies are retried with the utterance rephrased more and more directively.
/// When the attempts are used up a neutral fallback utterance is returned, so
/// an assistant turn always has something to say.
class ResponseRequester
{
  public:
    /// @param sleep Used for retry pauses; when empty the task sleeps in short slices, waking early on cancellation.
    ResponseRequester(ResponsePolicy policy, ResponseProvider& provider, Sleeper sleep = {});

    /// @brief Runs a request to completion.
    /// @param isCancelled Polled between attempts and for every streamed increment.
    /// @param onDelta Receives streamed increments; never called once cancelled.
    /// @return The outcome, or Cancelled, or a fatal error (e.g. AuthError).
    [[nodiscard]] auto request(const ResponseRequest& request,
                               const std::function<bool()>& isCancelled,
                               const ResponseDeltaCallback& onDelta) -> Result<ResponseOutcome>;

    /// @brief The prefix used for the @p emptyRetry-th (1-based) retry of an empty reply.
    [[nodiscard]] auto rephrasing(int emptyRetry) const -> const std::string&;

    [[nodiscard]] auto policy() const -> const ResponsePolicy& { return _policy; }

  private:
    void pause(Millis duration, const std::function<bool()>& isCancelled) const;

    ResponsePolicy _policy;
    ResponseProvider& _provider;
    Sleeper _sleep;
};

} // namespace voicetutor
