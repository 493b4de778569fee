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

#include <lib/core/TetherError.h>

#include <inttypes.h>
#include <stdio.h>

namespace tether {

namespace {

const char * DescribeError(TetherError error)
{
    switch (error.AsInteger())
    {
    case TETHER_NO_ERROR.AsInteger():
        return "Success";
    case TETHER_ERROR_INCORRECT_STATE.AsInteger():
        return "Incorrect state";
    case TETHER_ERROR_NOT_CONNECTED.AsInteger():
        return "Not connected";
    case TETHER_ERROR_NO_MEMORY.AsInteger():
        return "No memory";
    case TETHER_ERROR_MESSAGE_TOO_LONG.AsInteger():
        return "Message too long";
    case TETHER_ERROR_BUFFER_TOO_SMALL.AsInteger():
        return "Buffer too small";
    case TETHER_ERROR_INVALID_MESSAGE_TYPE.AsInteger():
        return "Invalid message type";
    case TETHER_ERROR_INVALID_ARGUMENT.AsInteger():
        return "Invalid argument";
    case TETHER_ERROR_INVALID_ACK_MESSAGE_COUNTER.AsInteger():
        return "Invalid acknowledged message counter";
    case TETHER_ERROR_MESSAGE_NOT_ACKNOWLEDGED.AsInteger():
        return "Message not acknowledged after max retries";
    case TETHER_ERROR_DUPLICATE_MESSAGE_RECEIVED.AsInteger():
        return "Duplicate message received";
    case TETHER_ERROR_MESSAGE_COUNTER_EXHAUSTED.AsInteger():
        return "Message counter exhausted";
    case TETHER_ERROR_KEY_NOT_FOUND.AsInteger():
        return "Key not found";
    case TETHER_ERROR_DRBG_FAILURE.AsInteger():
        return "Random number generator failure";
    case TETHER_ERROR_INTERNAL.AsInteger():
        return "Internal error";
    default:
        return nullptr;
    }
}

} // namespace

const char * ErrorStr(TetherError error)
{
    static char sErrorStr[64];

    const char * desc = DescribeError(error);
    if (desc != nullptr)
    {
        snprintf(sErrorStr, sizeof(sErrorStr), "Error 0x%08" PRIX32 ": %s", error.AsInteger(), desc);
    }
    else
    {
        snprintf(sErrorStr, sizeof(sErrorStr), "Error 0x%08" PRIX32, error.AsInteger());
    }
    return sErrorStr;
}

const char * TetherError::AsString() const
{
    return ErrorStr(*this);
}

} // namespace tether
