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
 *      This file defines the configuration parameters that are required
 *      for the Message Reliability Protocol.
 */

#include <messaging/ReliableMessageProtocolConfig.h>

#include <crypto/RandUtils.h>

namespace tether {

ReliableMessageProtocolConfig GetDefaultMRPConfig()
{
    // Default MRP intervals from the Parameters and Constants table of the protocol
    static constexpr const System::Clock::Milliseconds32 idleRetransTimeout   = 500_ms32;
    static constexpr const System::Clock::Milliseconds32 activeRetransTimeout = 300_ms32;
    static constexpr const System::Clock::Milliseconds16 activeThresholdTime  = 4000_ms16;
    return ReliableMessageProtocolConfig(idleRetransTimeout, activeRetransTimeout, activeThresholdTime);
}

Optional<ReliableMessageProtocolConfig> GetLocalMRPConfig()
{
    ReliableMessageProtocolConfig config(TETHER_CONFIG_MRP_LOCAL_IDLE_RETRY_INTERVAL, TETHER_CONFIG_MRP_LOCAL_ACTIVE_RETRY_INTERVAL,
                                         TETHER_CONFIG_MRP_ACTIVE_THRESHOLD);

    return (config == GetDefaultMRPConfig()) ? Optional<ReliableMessageProtocolConfig>::Missing()
                                             : Optional<ReliableMessageProtocolConfig>(config);
}

System::Clock::Timeout GetRetransmissionBackoff(System::Clock::Timeout baseInterval, uint8_t sendCount, bool computeMaxPossible)
{
    // Implement `i = MRP_BACKOFF_MARGIN * i`, where i == interval
    System::Clock::Milliseconds64 interval = baseInterval;
    interval *= MRP_BACKOFF_MARGIN_NUMERATOR;
    interval /= MRP_BACKOFF_MARGIN_DENOMINATOR;

    // Implement:
    //   mrpBackoffTime = i * MRP_BACKOFF_BASE^(max(0,n-MRP_BACKOFF_THRESHOLD)) * (1.0 + random(0,1) * MRP_BACKOFF_JITTER)
    // where n == sendCount

    // 1. Calculate exponent `max(0,n-MRP_BACKOFF_THRESHOLD)`
    int exponent = sendCount - MRP_BACKOFF_THRESHOLD;
    if (exponent < 0)
        exponent = 0; // Enforce floor
    if (exponent > kMaxRetransmissions - 1)
        exponent = kMaxRetransmissions - 1; // Enforce reasonable maximum after the last retry

    // 2. Calculate `mrpBackoffTime = i * MRP_BACKOFF_BASE^(max(0,n-MRP_BACKOFF_THRESHOLD))`
    uint32_t backoffNum   = 1;
    uint32_t backoffDenom = 1;

    for (int i = 0; i < exponent; i++)
    {
        backoffNum *= MRP_BACKOFF_BASE_NUMERATOR;
        backoffDenom *= MRP_BACKOFF_BASE_DENOMINATOR;
    }

    System::Clock::Milliseconds64 mrpBackoffTime = interval * backoffNum / backoffDenom;

    // 3. Calculate `mrpBackoffTime *= (1.0 + random(0,1) * MRP_BACKOFF_JITTER)`
    uint32_t jitter = MRP_BACKOFF_JITTER_BASE + (computeMaxPossible ? UINT8_MAX : Crypto::GetRandU8());
    mrpBackoffTime  = mrpBackoffTime * jitter / MRP_BACKOFF_JITTER_BASE;

    mrpBackoffTime += TETHER_CONFIG_MRP_RETRY_INTERVAL_SENDER_BOOST;

    return std::chrono::duration_cast<System::Clock::Timeout>(mrpBackoffTime);
}

} // namespace tether
