// SPDX-License-Identifier: Apache-2.0
#include "Synthesizer.hpp"

#include <core/Log.hpp>

namespace voicetutor
{

auto synthesizeWithRetries(Synthesizer& synthesizer,
                           std::string_view text,
                           int retries,
                           const std::function<bool()>& isCancelled) -> Result<AudioClip>
{
    auto lastError = Error { ErrorCode::SynthesisError, "Synthesis was not attempted" };

    for (auto attempt = 0; attempt <= retries; ++attempt)
    {
        if (isCancelled && isCancelled())
            return makeError(ErrorCode::Cancelled, "Synthesis cancelled");

        auto clip = synthesizer.synthesize(text);
        if (clip && !clip->empty())
            return clip;

        lastError = clip ? Error { ErrorCode::SynthesisError, "Synthesizer returned no audio" } : clip.error();
        if (!isRetryable(lastError.code))
            break;

        if (attempt < retries)
            log::warning("{} synthesis attempt {} failed: {}", synthesizer.name(), attempt + 1, lastError);
    }

    return std::unexpected(std::move(lastError));
}

} // namespace voicetutor
