/*
 *
 *    Copyright (c) 2021 Project CHIP Authors
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
 *      This file defines the local message counter used to number every
 *      outbound message of a session.
 */

#pragma once

#include <lib/core/TetherError.h>
#include <lib/support/CodeUtils.h>

#include <stdint.h>

namespace tether {

class MessageCounter
{
public:
    static constexpr uint32_t kMessageCounterRandomInitMask = 0x0FFFFFFF; ///< 28-bit mask

    uint32_t Value() const { return mValue; }

    /**
     * Resets the counter so the next message is numbered @p value.
     */
    void Init(uint32_t value)
    {
        mValue     = value;
        mExhausted = false;
    }

    /**
     * Seeds the counter with a random 28-bit value, leaving headroom before
     * the counter space is exhausted.
     */
    void InitWithRandom();

    /**
     * Returns the next counter in @p fetch and advances. Fails once the
     * 32-bit counter space has been used up, because counters must never
     * repeat within a session.
     */
    TETHER_ERROR AdvanceAndConsume(uint32_t & fetch)
    {
        VerifyOrReturnError(!mExhausted, TETHER_ERROR_MESSAGE_COUNTER_EXHAUSTED);
        fetch = mValue;
        if (mValue == UINT32_MAX)
        {
            mExhausted = true;
        }
        else
        {
            mValue++;
        }
        return TETHER_NO_ERROR;
    }

private:
    uint32_t mValue = 0;
    bool mExhausted = false;
};

} // namespace tether
