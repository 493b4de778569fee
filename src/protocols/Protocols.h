/*
 *
 *    Copyright (c) 2020-2021 Project CHIP Authors
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
 *      This file defines the protocol identifiers carried in every message
 *      and the traits mapping message type enums to their protocol.
 */

#pragma once

#include <stdint.h>

namespace tether {
namespace Protocols {

static constexpr uint16_t kStandardVendorId = 0x0000;

class Id
{
public:
    constexpr Id(uint16_t aVendorId, uint16_t aProtocolId) : mVendorId(aVendorId), mProtocolId(aProtocolId) {}

    constexpr bool operator==(const Id & aOther) const
    {
        return mVendorId == aOther.mVendorId && mProtocolId == aOther.mProtocolId;
    }

    constexpr bool operator!=(const Id & aOther) const { return !(*this == aOther); }

    constexpr uint32_t ToFullyQualifiedSpecForm() const { return ToUint32(); }

    static Id FromFullyQualifiedSpecForm(uint32_t aSpecForm)
    {
        return Id(static_cast<uint16_t>(aSpecForm >> 16), static_cast<uint16_t>(aSpecForm & 0xFFFF));
    }

    constexpr uint16_t GetVendorId() const { return mVendorId; }
    constexpr uint16_t GetProtocolId() const { return mProtocolId; }

private:
    constexpr uint32_t ToUint32() const { return (static_cast<uint32_t>(mVendorId) << 16) | mProtocolId; }

    uint16_t mVendorId;
    uint16_t mProtocolId;
};

// Pre-define some protocol ids we know about.
#define TETHER_STANDARD_PROTOCOL(name, id)                                                                                         \
    namespace name {                                                                                                               \
    static constexpr Protocols::Id Id(kStandardVendorId, id);                                                                     \
    } // namespace name.

TETHER_STANDARD_PROTOCOL(SecureChannel, 0x0000)             // Secure Channel Protocol
TETHER_STANDARD_PROTOCOL(InteractionModel, 0x0001)          // Interaction Model Protocol
TETHER_STANDARD_PROTOCOL(BDX, 0x0002)                       // Bulk Data Exchange Protocol
TETHER_STANDARD_PROTOCOL(UserDirectedCommissioning, 0x0003) // User Directed Commissioning Protocol
TETHER_STANDARD_PROTOCOL(Echo, 0x0004)                      // Echo Protocol

#undef TETHER_STANDARD_PROTOCOL

static constexpr Id NotSpecified(0xFFFF, 0xFFFF);

/**
 * Returns a printable name for @p protocol, or "Unknown" for a protocol
 * this node does not know about.
 */
const char * GetProtocolName(Id protocol);

/**
 * Returns a printable name for message type @p msgType of @p protocol, or
 * "----" when the type is unknown.
 */
const char * GetMessageTypeName(Id protocol, uint8_t msgType);

// Pre-define a protocol message type traits template that gets specialized
// for each message type enum to map the type to its protocol.
template <typename T>
struct MessageTypeTraits;

} // namespace Protocols
} // namespace tether
