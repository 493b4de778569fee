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
 *      This file defines the PeerMessageCounter class, which tracks the
 *      message counters received from a peer in order to detect duplicates.
 */

#pragma once

#include <lib/core/TetherConfig.h>
#include <lib/core/TetherError.h>

#include <bitset>
#include <stdint.h>

namespace tether {

class PeerMessageCounter
{
public:
    static constexpr size_t kMessageCounterWindowSize = TETHER_CONFIG_MESSAGE_COUNTER_WINDOW_SIZE;

    void Reset()
    {
        mStatus = Status::NotSynced;
        mMaxCounter = 0;
        mWindow.reset();
    }

    bool IsSynchronized() const { return mStatus == Status::Synced; }

    /**
     * @brief Checks @p counter against the window without changing it.
     *
     * @retval TETHER_ERROR_DUPLICATE_MESSAGE_RECEIVED if the counter was
     *         already seen or is too old to tell.
     * @retval TETHER_ERROR_INCORRECT_STATE if the counter is not synchronized.
     */
    TETHER_ERROR Verify(uint32_t counter) const;

    /**
     * @brief Records @p counter as received. Must follow a successful Verify.
     */
    void Commit(uint32_t counter);

    /**
     * @brief Verify for a peer whose counter is not known yet: the first
     *        counter received is trusted and becomes the baseline.
     */
    TETHER_ERROR VerifyOrTrustFirst(uint32_t counter);

    void SetCounter(uint32_t value)
    {
        mStatus = Status::Synced;
        mMaxCounter = value;
        mWindow.reset();
    }

    uint32_t GetCounter() const { return mMaxCounter; }

private:
    enum class Status
    {
        NotSynced, // No state associated
        Synced,    // mMaxCounter and mWindow are valid
    };

    Status mStatus = Status::NotSynced;

    // Highest counter received so far.
    uint32_t mMaxCounter = 0;

    // Bit i is set when counter mMaxCounter - i - 1 has been received.
    std::bitset<kMessageCounterWindowSize> mWindow;
};

} // namespace tether
