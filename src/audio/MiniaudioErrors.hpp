// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <miniaudio.h>

namespace voicetutor
{

/// @brief Maps a miniaudio device result onto the device error taxonomy.
///
/// Permission problems become DeviceError, a missing device NotFoundError and
/// exclusive-use conflicts ConcurrencyError. Anything else is a generic DeviceError.
[[nodiscard]] inline auto classifyDeviceResult(ma_result result) -> ErrorCode
{
    switch (result)
    {
        case MA_ACCESS_DENIED: return ErrorCode::DeviceError;
        case MA_NO_DEVICE:
        case MA_DOES_NOT_EXIST:
        case MA_NO_BACKEND: return ErrorCode::NotFoundError;
        case MA_BUSY:
        case MA_SHARE_MODE_NOT_SUPPORTED:
        case MA_DEVICE_ALREADY_INITIALIZED:
        case MA_FAILED_TO_OPEN_BACKEND_DEVICE: return ErrorCode::ConcurrencyError;
        default: return ErrorCode::DeviceError;
    }
}

} // namespace voicetutor
