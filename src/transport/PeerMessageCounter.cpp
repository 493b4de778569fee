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

#include <transport/PeerMessageCounter.h>

#include <lib/support/CodeUtils.h>

namespace tether {

TETHER_ERROR PeerMessageCounter::Verify(uint32_t counter) const
{
    VerifyOrReturnError(mStatus == Status::Synced, TETHER_ERROR_INCORRECT_STATE);

    if (counter > mMaxCounter)
    {
        return TETHER_NO_ERROR;
    }

    if (counter == mMaxCounter)
    {
        return TETHER_ERROR_DUPLICATE_MESSAGE_RECEIVED;
    }

    uint32_t offset = mMaxCounter - counter;
    if (offset > kMessageCounterWindowSize)
    {
        // Too old to tell; treat as a duplicate.
        return TETHER_ERROR_DUPLICATE_MESSAGE_RECEIVED;
    }

    if (mWindow.test(offset - 1))
    {
        return TETHER_ERROR_DUPLICATE_MESSAGE_RECEIVED;
    }

    return TETHER_NO_ERROR;
}

void PeerMessageCounter::Commit(uint32_t counter)
{
    if (mStatus != Status::Synced)
    {
        SetCounter(counter);
        return;
    }

    if (counter > mMaxCounter)
    {
        uint32_t shift = counter - mMaxCounter;
        if (shift > kMessageCounterWindowSize)
        {
            mWindow.reset();
        }
        else
        {
            mWindow <<= shift;
            // The previous maximum is now behind the new one.
            mWindow.set(shift - 1);
        }
        mMaxCounter = counter;
        return;
    }

    uint32_t offset = mMaxCounter - counter;
    if (offset > 0 && offset <= kMessageCounterWindowSize)
    {
        mWindow.set(offset - 1);
    }
}

TETHER_ERROR PeerMessageCounter::VerifyOrTrustFirst(uint32_t counter)
{
    if (mStatus == Status::NotSynced)
    {
        SetCounter(counter);
        return TETHER_NO_ERROR;
    }
    return Verify(counter);
}

} // namespace tether
