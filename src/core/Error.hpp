// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <expected>
#include <format>
#include <string>
#include <string_view>

namespace voicetutor
{

/// @brief Error codes for categorizing failures across the voice engine.
enum class ErrorCode
{
    Unknown,
    InvalidArgument,
    IoError,
    ConfigError,
    ProtocolError,
    AudioError,
    ModelLoadError,
    DeviceError,
    NotFoundError,
    ConcurrencyError,
    TranscriptionError,
    SynthesisError,
    NetworkError,
    TimeoutError,
    EmptyResponseError,
    AuthError,
    Cancelled,
};

/// @brief Represents an error with a code and descriptive message.
struct Error
{
    ErrorCode code = ErrorCode::Unknown;
    std::string message;
};

/// @brief Result type for operations that return a value or an error.
/// @tparam T The success value type.
template <typename T>
using Result = std::expected<T, Error>;

/// @brief Result type for operations that return no value on success.
using VoidResult = std::expected<void, Error>;

/// @brief Creates an unexpected Error value for use with std::expected.
/// @param code The error code.
/// @param message A descriptive error message.
/// @return An unexpected Error.
[[nodiscard]] inline auto makeError(ErrorCode code, std::string message) -> std::unexpected<Error>
{
    return std::unexpected<Error>(Error { code, std::move(message) });
}

/// @brief Returns the name of an error code.
[[nodiscard]] constexpr auto errorCodeName(ErrorCode code) -> std::string_view
{
    switch (code)
    {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::IoError: return "IoError";
        case ErrorCode::ConfigError: return "ConfigError";
        case ErrorCode::ProtocolError: return "ProtocolError";
        case ErrorCode::AudioError: return "AudioError";
        case ErrorCode::ModelLoadError: return "ModelLoadError";
        case ErrorCode::DeviceError: return "DeviceError";
        case ErrorCode::NotFoundError: return "NotFoundError";
        case ErrorCode::ConcurrencyError: return "ConcurrencyError";
        case ErrorCode::TranscriptionError: return "TranscriptionError";
        case ErrorCode::SynthesisError: return "SynthesisError";
        case ErrorCode::NetworkError: return "NetworkError";
        case ErrorCode::TimeoutError: return "TimeoutError";
        case ErrorCode::EmptyResponseError: return "EmptyResponseError";
        case ErrorCode::AuthError: return "AuthError";
        case ErrorCode::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

/// @brief Returns true for errors that end the session until an explicit reset.
///
/// Device acquisition failures and rejected credentials require user action;
/// retrying them automatically cannot succeed.
[[nodiscard]] constexpr auto isFatal(ErrorCode code) -> bool
{
    switch (code)
    {
        case ErrorCode::DeviceError:
        case ErrorCode::NotFoundError:
        case ErrorCode::ConcurrencyError:
        case ErrorCode::AuthError: return true;
        default: return false;
    }
}

/// @brief Returns true for errors worth another attempt with the same input.
[[nodiscard]] constexpr auto isRetryable(ErrorCode code) -> bool
{
    switch (code)
    {
        case ErrorCode::NetworkError:
        case ErrorCode::TimeoutError:
        case ErrorCode::TranscriptionError:
        case ErrorCode::SynthesisError:
        case ErrorCode::EmptyResponseError: return true;
        default: return false;
    }
}

} // namespace voicetutor

template <>
struct std::formatter<voicetutor::Error>: std::formatter<std::string>
{
    auto format(const voicetutor::Error& error, auto& ctx) const
    {
        return std::formatter<std::string>::format(
            std::format("[{}] {}", voicetutor::errorCodeName(error.code), error.message), ctx);
    }
};
