// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <format>
#include <functional>
#include <optional>
#include <string_view>
#include <utility>

namespace voicetutor::log
{

/// @brief Verbosity level, ordered from least to most verbose.
enum class Level
{
    Error,
    Warning,
    Info,
    Debug,
    Trace,
};

/// @brief Receives every message that passes the level filter, without prefix.
using LogCallback = std::function<void(Level level, std::string_view message)>;

/// @brief Routes all messages to @p callback instead of stderr. An empty callback restores stderr.
void setCallback(LogCallback callback);

void setLevel(Level level);
[[nodiscard]] auto getLevel() -> Level;

/// @brief Parses "error", "warning" (or "warn"), "info", "debug" or "trace".
[[nodiscard]] auto levelFromString(std::string_view name) -> std::optional<Level>;
[[nodiscard]] auto levelName(Level level) -> std::string_view;

[[nodiscard]] inline auto isEnabled(Level level) -> bool
{
    return level == Level::Error || level <= getLevel();
}

/// @brief Emits an already formatted message.
///
/// The stderr sink prefixes each line with the level and the time elapsed
/// since the first message, which makes turn latencies readable in raw logs.
void write(Level level, std::string_view message);

/// @brief Installs a callback for the lifetime of the object and restores stderr output and the
///        previous level afterwards.
class ScopedCallback
{
  public:
    explicit ScopedCallback(LogCallback callback): _previousLevel { getLevel() }
    {
        setCallback(std::move(callback));
    }

    ~ScopedCallback()
    {
        setCallback({});
        setLevel(_previousLevel);
    }

    ScopedCallback(const ScopedCallback&) = delete;
    auto operator=(const ScopedCallback&) -> ScopedCallback& = delete;

  private:
    Level _previousLevel;
};

/// @brief Formats and emits a message when @p level is enabled.
template <typename... Args>
void message(Level level, std::format_string<Args...> fmt, Args&&... args)
{
    if (isEnabled(level))
        write(level, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void error(std::format_string<Args...> fmt, Args&&... args)
{
    message(Level::Error, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void warning(std::format_string<Args...> fmt, Args&&... args)
{
    message(Level::Warning, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void info(std::format_string<Args...> fmt, Args&&... args)
{
    message(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void debug(std::format_string<Args...> fmt, Args&&... args)
{
    message(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void trace(std::format_string<Args...> fmt, Args&&... args)
{
    message(Level::Trace, fmt, std::forward<Args>(args)...);
}

} // namespace voicetutor::log
