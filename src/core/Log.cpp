// SPDX-License-Identifier: Apache-2.0
#include "Log.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <print>

namespace voicetutor::log
{

namespace
{
    std::atomic<Level> globalLevel = Level::Info;
    auto globalCallback = LogCallback {};
    auto callbackMutex = std::mutex {};

    /// @brief Reference point for the elapsed-time prefix, fixed on first use.
    auto processStart() -> std::chrono::steady_clock::time_point
    {
        static auto const start = std::chrono::steady_clock::now();
        return start;
    }
} // namespace

void setCallback(LogCallback callback)
{
    auto lock = std::lock_guard(callbackMutex);
    globalCallback = std::move(callback);
}

void setLevel(Level level)
{
    globalLevel.store(level, std::memory_order_relaxed);
}

auto getLevel() -> Level
{
    return globalLevel.load(std::memory_order_relaxed);
}

auto levelFromString(std::string_view name) -> std::optional<Level>
{
    if (name == "error")
        return Level::Error;
    if (name == "warning" || name == "warn")
        return Level::Warning;
    if (name == "info")
        return Level::Info;
    if (name == "debug")
        return Level::Debug;
    if (name == "trace")
        return Level::Trace;
    return std::nullopt;
}

auto levelName(Level level) -> std::string_view
{
    switch (level)
    {
        case Level::Error: return "error";
        case Level::Warning: return "warning";
        case Level::Info: return "info";
        case Level::Debug: return "debug";
        case Level::Trace: return "trace";
    }
    return "info";
}

void write(Level level, std::string_view message)
{
    if (!isEnabled(level))
        return;

    {
        // Logging happens from device, worker and conversation threads alike.
        auto lock = std::lock_guard(callbackMutex);
        if (globalCallback)
        {
            globalCallback(level, message);
            return;
        }
    }

    constexpr auto levelPrefix = [](Level l) -> std::string_view {
        switch (l)
        {
            case Level::Error: return "ERROR";
            case Level::Warning: return "WARN ";
            case Level::Info: return "INFO ";
            case Level::Debug: return "DEBUG";
            case Level::Trace: return "TRACE";
        }
        return "?????";
    };

    auto const elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - processStart());
    std::println(stderr,
                 "[{} +{}.{:03}] {}",
                 levelPrefix(level),
                 elapsed.count() / 1000,
                 elapsed.count() % 1000,
                 message);
}

} // namespace voicetutor::log
