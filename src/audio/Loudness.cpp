// SPDX-License-Identifier: Apache-2.0
#include "Loudness.hpp"

#include <algorithm>
#include <cmath>

namespace voicetutor
{

auto rmsPercent(std::span<const float> samples) -> float
{
    if (samples.empty())
        return 0.0f;

    auto sum = 0.0;
    for (auto const sample: samples)
        sum += static_cast<double>(sample) * sample;

    return static_cast<float>(std::sqrt(sum / static_cast<double>(samples.size())) * 100.0);
}

auto peakPercent(std::span<const float> samples) -> float
{
    auto peak = 0.0f;
    for (auto const sample: samples)
        peak = std::max(peak, std::abs(sample));
    return peak * 100.0f;
}

auto computeEnvelope(std::span<const float> samples,
                     unsigned sampleRate,
                     unsigned channels,
                     TimePoint start,
                     Millis frameDuration) -> LoudnessEnvelope
{
    auto envelope = LoudnessEnvelope { .start = start, .frameDuration = frameDuration, .values = {} };
    if (sampleRate == 0 || channels == 0 || frameDuration.count() <= 0)
        return envelope;

    auto const window = static_cast<std::size_t>(sampleRate) * channels
                        * static_cast<std::size_t>(frameDuration.count()) / 1000;
    if (window == 0)
        return envelope;

    for (auto offset = std::size_t { 0 }; offset < samples.size(); offset += window)
    {
        auto const count = std::min(window, samples.size() - offset);
        envelope.values.push_back(rmsPercent(samples.subspan(offset, count)));
    }

    return envelope;
}

auto envelopeOf(std::span<const AudioFrame> frames) -> LoudnessEnvelope
{
    auto envelope = LoudnessEnvelope {};
    if (frames.empty())
        return envelope;

    envelope.start = frames.front().timestamp;
    envelope.frameDuration = frames.front().duration();
    envelope.values.reserve(frames.size());
    for (auto const& frame: frames)
        envelope.values.push_back(rmsPercent(frame.samples));
    return envelope;
}

auto correlation(std::span<const float> a, std::span<const float> b) -> float
{
    auto const n = std::min(a.size(), b.size());
    if (n < 2)
        return 0.0f;

    auto meanA = 0.0;
    auto meanB = 0.0;
    for (auto i = std::size_t { 0 }; i < n; ++i)
    {
        meanA += a[i];
        meanB += b[i];
    }
    meanA /= static_cast<double>(n);
    meanB /= static_cast<double>(n);

    auto covariance = 0.0;
    auto varianceA = 0.0;
    auto varianceB = 0.0;
    for (auto i = std::size_t { 0 }; i < n; ++i)
    {
        auto const da = a[i] - meanA;
        auto const db = b[i] - meanB;
        covariance += da * db;
        varianceA += da * da;
        varianceB += db * db;
    }

    if (varianceA <= 1e-12 || varianceB <= 1e-12)
        return 0.0f;

    return static_cast<float>(covariance / std::sqrt(varianceA * varianceB));
}

} // namespace voicetutor
