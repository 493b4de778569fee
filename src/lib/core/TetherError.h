/*
 *
 *    Copyright (c) 2020-2023 Project CHIP Authors
 *    All rights reserved.
 *
 *    Licensed under the Apache License, Version 2.0 (the "License");
 *    you may not use this file except in compliance with the License.
 *    You may obtain a copy of the License at
 *
 *        http://www.apache.org/licenses/LICENSE-2.0
 *
 *    Unless required by applicable law or agreed to in writing, software
 *    distributed under the License is distributed on an "AS IS" BASIS,
 *    WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 *    See the License for the specific language governing permissions and
 *    limitations under the License.
 */

/**
 *    @file
 *      This file defines the error type returned by every fallible Tether API,
 *      together with the named error constants.
 */

#pragma once

#include <stdint.h>

namespace tether {

class TetherError
{
public:
    using StorageType = uint32_t;

    constexpr TetherError() : mError(0) {}
    explicit constexpr TetherError(StorageType error) : mError(error) {}

    constexpr bool operator==(const TetherError & other) const { return mError == other.mError; }
    constexpr bool operator!=(const TetherError & other) const { return mError != other.mError; }

    constexpr bool IsSuccess() const { return mError == 0; }
    constexpr StorageType AsInteger() const { return mError; }

    /**
     * Returns a human readable description of the error, suitable for a "%s"
     * conversion. The returned string lives in a static buffer and is only
     * valid until the next call.
     */
    const char * AsString() const;
    const char * Format() const { return AsString(); }

private:
    StorageType mError;
};

/**
 * Returns a printable description of @p error.
 */
const char * ErrorStr(TetherError error);

} // namespace tether

using TETHER_ERROR = ::tether::TetherError;

#define TETHER_ERROR_FORMAT "s"

#define TETHER_CORE_ERROR(e) ::tether::TetherError(static_cast<::tether::TetherError::StorageType>(e))

#define TETHER_NO_ERROR TETHER_CORE_ERROR(0x00)

// clang-format off
#define TETHER_ERROR_INCORRECT_STATE                    TETHER_CORE_ERROR(0x03)
#define TETHER_ERROR_NOT_CONNECTED                      TETHER_CORE_ERROR(0x08)
#define TETHER_ERROR_NO_MEMORY                          TETHER_CORE_ERROR(0x0b)
#define TETHER_ERROR_MESSAGE_TOO_LONG                   TETHER_CORE_ERROR(0x11)
#define TETHER_ERROR_BUFFER_TOO_SMALL                   TETHER_CORE_ERROR(0x19)
#define TETHER_ERROR_INVALID_MESSAGE_TYPE               TETHER_CORE_ERROR(0x1f)
#define TETHER_ERROR_INVALID_ARGUMENT                   TETHER_CORE_ERROR(0x2f)
#define TETHER_ERROR_INVALID_ACK_MESSAGE_COUNTER        TETHER_CORE_ERROR(0x40)
#define TETHER_ERROR_MESSAGE_NOT_ACKNOWLEDGED           TETHER_CORE_ERROR(0x42)
#define TETHER_ERROR_DUPLICATE_MESSAGE_RECEIVED         TETHER_CORE_ERROR(0x52)
#define TETHER_ERROR_MESSAGE_COUNTER_EXHAUSTED          TETHER_CORE_ERROR(0x5b)
#define TETHER_ERROR_KEY_NOT_FOUND                      TETHER_CORE_ERROR(0xa0)
#define TETHER_ERROR_DRBG_FAILURE                       TETHER_CORE_ERROR(0xa6)
#define TETHER_ERROR_INTERNAL                           TETHER_CORE_ERROR(0xac)
// clang-format on
