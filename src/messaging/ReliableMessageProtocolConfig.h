/*
 *
 *    Copyright (c) 2020-2021 Project CHIP Authors
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
 *      for the Message Reliability Protocol, and the retransmission
 *      backoff computed from them.
 */

#pragma once

#include <lib/core/Optional.h>
#include <lib/core/TetherConfig.h>
#include <system/SystemClock.h>

#include <stdint.h>

namespace tether {

using namespace System::Clock::Literals;

/// Number of retransmissions of a reliable message before its exchange is abandoned.
constexpr uint8_t kMaxRetransmissions = TETHER_CONFIG_RMP_DEFAULT_MAX_RETRANS;

/// How long an owed acknowledgement waits for a piggyback opportunity.
constexpr System::Clock::Timeout kStandaloneAckTimeout = TETHER_CONFIG_RMP_DEFAULT_ACK_TIMEOUT;

/// Maximum number of application payload bytes in one message.
constexpr size_t kMaxAppMessageLen = TETHER_CONFIG_MAX_APP_MESSAGE_LEN;

static_assert(TETHER_CONFIG_MAX_APP_MESSAGE_LEN < TETHER_CONFIG_MAX_FRAME_SIZE,
              "Application payload must leave room for headers within a frame");

// MRP_BACKOFF_JITTER = 0.25, applied as (1024 + [0, 255]) / 1024
constexpr uint32_t MRP_BACKOFF_JITTER_BASE = 1024;
// MRP_BACKOFF_MARGIN = 1.1
constexpr uint32_t MRP_BACKOFF_MARGIN_NUMERATOR   = 1127;
constexpr uint32_t MRP_BACKOFF_MARGIN_DENOMINATOR = 1024;
// MRP_BACKOFF_BASE = 1.6
constexpr uint32_t MRP_BACKOFF_BASE_NUMERATOR   = 16;
constexpr uint32_t MRP_BACKOFF_BASE_DENOMINATOR = 10;
constexpr int MRP_BACKOFF_THRESHOLD             = 1;

struct ReliableMessageProtocolConfig
{
    ReliableMessageProtocolConfig(System::Clock::Milliseconds32 idleInterval, System::Clock::Milliseconds32 activeInterval,
                                  System::Clock::Milliseconds16 activeThreshold = TETHER_CONFIG_MRP_ACTIVE_THRESHOLD) :
        mIdleRetransTimeout(idleInterval),
        mActiveRetransTimeout(activeInterval), mActiveThresholdTime(activeThreshold)
    {}

    // Configurable timeout in msec for retransmission of the first sent message when the peer is idle.
    System::Clock::Milliseconds32 mIdleRetransTimeout;

    // Configurable timeout in msec for retransmission of the first sent message when the peer is active.
    System::Clock::Milliseconds32 mActiveRetransTimeout;

    // Time a peer stays active after the last message heard from it.
    System::Clock::Milliseconds16 mActiveThresholdTime;

    bool operator==(const ReliableMessageProtocolConfig & that) const
    {
        return mIdleRetransTimeout == that.mIdleRetransTimeout && mActiveRetransTimeout == that.mActiveRetransTimeout &&
            mActiveThresholdTime == that.mActiveThresholdTime;
    }
};

/// @brief The default MRP config. The value is defined by the TETHER_CONFIG_MRP_LOCAL_* macros.
ReliableMessageProtocolConfig GetDefaultMRPConfig();

/**
 * @brief
 *  Returns the local ReliableMessageProtocolConfig, or a missing value when
 *  it matches the defaults and need not be advertised.
 */
Optional<ReliableMessageProtocolConfig> GetLocalMRPConfig();

/**
 * @brief
 *   Computes the time to wait before the next transmission attempt of a
 *   reliable message.
 *
 * @param[in] baseInterval        The peer's retry interval (active or idle).
 * @param[in] sendCount           Number of retransmissions already performed.
 * @param[in] computeMaxPossible  Use the largest jitter instead of a random one.
 *
 * @return The backoff, including TETHER_CONFIG_MRP_RETRY_INTERVAL_SENDER_BOOST.
 */
System::Clock::Timeout GetRetransmissionBackoff(System::Clock::Timeout baseInterval, uint8_t sendCount,
                                                bool computeMaxPossible = false);

} // namespace tether
