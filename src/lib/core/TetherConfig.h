/*
 *
 *    Copyright (c) 2020-2022 Project CHIP Authors
 *    Copyright (c) 2013-2017 Nest Labs, Inc.
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
 *      Default compile-time configuration for Tether. Every value can be
 *      overridden by defining it before this header is included, typically
 *      with a -D flag in the build.
 */

#pragma once

/**
 *  @def TETHER_CONFIG_MRP_LOCAL_IDLE_RETRY_INTERVAL
 *
 *  @brief
 *    Base retry interval of the present node when it is in the idle state.
 *    Used as the retransmission baseline for a peer that has not advertised
 *    its own parameters.
 */
#ifndef TETHER_CONFIG_MRP_LOCAL_IDLE_RETRY_INTERVAL
#define TETHER_CONFIG_MRP_LOCAL_IDLE_RETRY_INTERVAL (500_ms32)
#endif

/**
 *  @def TETHER_CONFIG_MRP_LOCAL_ACTIVE_RETRY_INTERVAL
 *
 *  @brief
 *    Base retry interval of the present node when it is in the active state.
 */
#ifndef TETHER_CONFIG_MRP_LOCAL_ACTIVE_RETRY_INTERVAL
#define TETHER_CONFIG_MRP_LOCAL_ACTIVE_RETRY_INTERVAL (300_ms32)
#endif

/**
 *  @def TETHER_CONFIG_MRP_ACTIVE_THRESHOLD
 *
 *  @brief
 *    Amount of time a node stays in the active state after network activity.
 */
#ifndef TETHER_CONFIG_MRP_ACTIVE_THRESHOLD
#define TETHER_CONFIG_MRP_ACTIVE_THRESHOLD (4000_ms16)
#endif

/**
 *  @def TETHER_CONFIG_RMP_DEFAULT_ACK_TIMEOUT
 *
 *  @brief
 *    How long an owed acknowledgement waits for an outbound message to
 *    piggyback on before a standalone acknowledgement is sent.
 */
#ifndef TETHER_CONFIG_RMP_DEFAULT_ACK_TIMEOUT
#define TETHER_CONFIG_RMP_DEFAULT_ACK_TIMEOUT (200_ms32)
#endif

/**
 *  @def TETHER_CONFIG_RMP_DEFAULT_MAX_RETRANS
 *
 *  @brief
 *    Number of retransmissions of a reliable message before the exchange
 *    carrying it is abandoned.
 */
#ifndef TETHER_CONFIG_RMP_DEFAULT_MAX_RETRANS
#define TETHER_CONFIG_RMP_DEFAULT_MAX_RETRANS 5
#endif

/**
 *  @def TETHER_CONFIG_MRP_RETRY_INTERVAL_SENDER_BOOST
 *
 *  @brief
 *    Extra time added to every computed retransmission backoff, for high
 *    latency links where the peer's advertised intervals are too tight.
 */
#ifndef TETHER_CONFIG_MRP_RETRY_INTERVAL_SENDER_BOOST
#define TETHER_CONFIG_MRP_RETRY_INTERVAL_SENDER_BOOST (0_ms32)
#endif

/**
 *  @def TETHER_CONFIG_MAX_FRAME_SIZE
 *
 *  @brief
 *    Size budget of one transport frame, headers included.
 */
#ifndef TETHER_CONFIG_MAX_FRAME_SIZE
#define TETHER_CONFIG_MAX_FRAME_SIZE 1280
#endif

/**
 *  @def TETHER_CONFIG_MAX_APP_MESSAGE_LEN
 *
 *  @brief
 *    Maximum number of application payload bytes carried by one message.
 */
#ifndef TETHER_CONFIG_MAX_APP_MESSAGE_LEN
#define TETHER_CONFIG_MAX_APP_MESSAGE_LEN 1200
#endif

/**
 *  @def TETHER_CONFIG_MESSAGE_COUNTER_WINDOW_SIZE
 *
 *  @brief
 *    Number of message counters behind the highest one seen that are still
 *    tracked for duplicate detection.
 */
#ifndef TETHER_CONFIG_MESSAGE_COUNTER_WINDOW_SIZE
#define TETHER_CONFIG_MESSAGE_COUNTER_WINDOW_SIZE 32
#endif

/**
 *  @def TETHER_ERROR_LOGGING, TETHER_PROGRESS_LOGGING, TETHER_DETAIL_LOGGING
 *
 *  @brief
 *    Compile-time switches for each log category.
 */
#ifndef TETHER_ERROR_LOGGING
#define TETHER_ERROR_LOGGING 1
#endif

#ifndef TETHER_PROGRESS_LOGGING
#define TETHER_PROGRESS_LOGGING 1
#endif

#ifndef TETHER_DETAIL_LOGGING
#define TETHER_DETAIL_LOGGING 1
#endif

#ifndef TETHER_AUTOMATION_LOGGING
#define TETHER_AUTOMATION_LOGGING 1
#endif
