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
 *      Message types of the Secure Channel protocol. Only the standalone
 *      acknowledgement is produced by this library; the session
 *      establishment types are listed so they are recognized when logged.
 */

#pragma once

#include <protocols/Protocols.h>

#include <stdint.h>

namespace tether {
namespace Protocols {
namespace SecureChannel {

/**
 * SecureChannel Protocol Message Types
 */
enum class MsgType : uint8_t
{
    // Message Counter Synchronization Protocol Message Types
    MsgCounterSyncReq = 0x00,
    MsgCounterSyncRsp = 0x01,

    // Reliable Messaging Protocol Message Types
    StandaloneAck = 0x10,

    // Password-based session establishment Message Types
    PBKDFParamRequest  = 0x20,
    PBKDFParamResponse = 0x21,
    PASE_Pake1         = 0x22,
    PASE_Pake2         = 0x23,
    PASE_Pake3         = 0x24,

    // Certificate-based session establishment Message Types
    CASE_Sigma1       = 0x30,
    CASE_Sigma2       = 0x31,
    CASE_Sigma3       = 0x32,
    CASE_Sigma2Resume = 0x33,

    StatusReport = 0x40,
};

} // namespace SecureChannel

template <>
struct MessageTypeTraits<SecureChannel::MsgType>
{
    static constexpr const Protocols::Id & ProtocolId() { return SecureChannel::Id; }
};

} // namespace Protocols
} // namespace tether
