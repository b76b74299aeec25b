// SPDX-License-Identifier: Apache-2.0
#include "ResponseRequester.hpp"

#include <core/Log.hpp>
#include <core/TextUtils.hpp>

#include <algorithm>
#include <format>
#include <thread>

namespace voicetutor
{

namespace
{

    constexpr auto SleepSlice = Millis { 50 };

    auto cancelled(const std::function<bool()>& isCancelled) -> bool
    {
        return isCancelled && isCancelled();
    }

} // namespace

ResponseRequester::ResponseRequester(ResponsePolicy policy, ResponseProvider& provider, Sleeper sleep):
    _policy(std::move(policy)), _provider(provider), _sleep(std::move(sleep))
{
    _policy.maxRetries = std::max(_policy.maxRetries, 0);
}

auto ResponseRequester::rephrasing(int emptyRetry) const -> const std::string&
{
    if (emptyRetry >= 1 && static_cast<std::size_t>(emptyRetry) <= _policy.rephrasings.size())
        return _policy.rephrasings[static_cast<std::size_t>(emptyRetry - 1)];
    return _policy.defaultRephrasing;
}

void ResponseRequester::pause(Millis duration, const std::function<bool()>& isCancelled) const
{
    if (_sleep)
    {
        _sleep(duration);
        return;
    }

    auto const deadline = SteadyClock::now() + duration;
    while (!cancelled(isCancelled) && SteadyClock::now() < deadline)
        std::this_thread::sleep_for(std::min<SteadyClock::duration>(SleepSlice, deadline - SteadyClock::now()));
}

auto ResponseRequester::request(const ResponseRequest& request,
                                const std::function<bool()>& isCancelled,
                                const ResponseDeltaCallback& onDelta) -> Result<ResponseOutcome>
{
    auto emptyRetries = 0;
    auto failureRetries = 0;

    for (auto attempt = 1;; ++attempt)
    {
        if (cancelled(isCancelled))
            return makeError(ErrorCode::Cancelled, "Response request cancelled");

        auto effective = request;
        if (emptyRetries > 0)
            effective.content = std::format("{} {}", rephrasing(emptyRetries), request.content);

        auto partial = std::string {};
        auto result = _provider.request(effective, [&](std::string_view delta) {
            if (cancelled(isCancelled))
                return false;
            partial += delta;
            return !onDelta || onDelta(delta);
        });

        if (cancelled(isCancelled))
            return makeError(ErrorCode::Cancelled, "Response request cancelled");

        auto const retriesUsed = emptyRetries + failureRetries;

        if (result && !text::trim(*result).empty())
            return ResponseOutcome { .text = std::move(*result), .attempts = attempt };

        if (result)
        {
            if (retriesUsed < _policy.maxRetries)
            {
                auto const delay = _policy.emptyRetryBase * (1 << retriesUsed);
                ++emptyRetries;
                log::warning("Empty model reply (attempt {}), retrying as \"{} ...\" in {} ms",
                             attempt,
                             rephrasing(emptyRetries),
                             delay.count());
                pause(delay, isCancelled);
                continue;
            }

            log::warning("Model replies stayed empty after {} attempts, using fallback", attempt);
            return ResponseOutcome {
                .text = _policy.emptyFallback,
                .fallback = true,
                .error = Error { ErrorCode::EmptyResponseError, std::format("Empty reply after {} attempts", attempt) },
                .attempts = attempt,
            };
        }

        auto const& error = result.error();
        if (error.code == ErrorCode::Cancelled)
            return std::unexpected(error);

        if (isFatal(error.code))
        {
            log::error("Model request failed: {}", error);
            return std::unexpected(error);
        }

        // Increments already went out; a retry would repeat them.
        if (!partial.empty())
        {
            log::warning("Model stream broke off after {} bytes: {}", partial.size(), error);
            return ResponseOutcome { .text = std::move(partial), .error = error, .attempts = attempt };
        }

        if (isRetryable(error.code) && retriesUsed < _policy.maxRetries)
        {
            ++failureRetries;
            log::warning("Model request attempt {} failed ({}), retrying in {} ms",
                         attempt,
                         error,
                         _policy.retryBackoff.count());
            pause(_policy.retryBackoff, isCancelled);
            continue;
        }

        log::warning("Model request failed after {} attempts ({}), using fallback", attempt, error);
        return ResponseOutcome {
            .text = _policy.networkFallback,
            .fallback = true,
            .error = error,
            .attempts = attempt,
        };
    }
}

} // namespace voicetutor
