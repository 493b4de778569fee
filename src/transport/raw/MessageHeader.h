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
 *      This file defines the message envelope exchanged between the
 *      exchange layer and the transport: exchange flags, counters,
 *      protocol identification and the application payload.
 */

#pragma once

#include <lib/core/Optional.h>
#include <lib/support/BitFlags.h>
#include <lib/support/Span.h>
#include <protocols/Protocols.h>
#include <protocols/secure_channel/Constants.h>

#include <stdint.h>
#include <utility>
#include <vector>

namespace tether {

using NodeId = uint64_t;

constexpr NodeId kUndefinedNodeId = 0ULL;

namespace Header {

/**
 *  @brief
 *    The Exchange flags field carried in every message.
 */
enum class ExFlagValues : uint8_t
{
    /// Set when current message is sent by the initiator of an exchange.
    kExchangeFlag_Initiator = 0x01,

    /// Set when current message is an acknowledgment for a previously received message.
    kExchangeFlag_AckMsg = 0x02,

    /// Set when current message is requesting an acknowledgment from the recipient.
    kExchangeFlag_NeedsAck = 0x04,

    /// Secured Extension block is present.
    kExchangeFlag_SecuredExtension = 0x08,

    /// Set when a vendor id is prepended to the Message Protocol Id field.
    kExchangeFlag_VendorIdPresent = 0x10,
};

using ExFlags = BitFlags<ExFlagValues>;

} // namespace Header

/**
 * One message as seen by the exchange layer. Outbound messages are fully
 * populated by an exchange before being handed to the session; inbound
 * messages additionally carry the duplicate marker set by the session.
 */
class Message
{
public:
    uint32_t GetMessageCounter() const { return mMessageCounter; }

    Message & SetMessageCounter(uint32_t counter)
    {
        mMessageCounter = counter;
        return *this;
    }

    /** Get the exchange id of this message. */
    uint16_t GetExchangeID() const { return mExchangeID; }

    Message & SetExchangeID(uint16_t id)
    {
        mExchangeID = id;
        return *this;
    }

    /** Get the Protocol ID from this message. */
    Protocols::Id GetProtocolID() const { return mProtocolID; }

    /** Get the message type from this message. */
    uint8_t GetMessageType() const { return mMessageType; }

    /** Check whether the message has a given protocol/type pair. */
    bool HasMessageType(Protocols::Id protocol, uint8_t type) const
    {
        return mProtocolID == protocol && mMessageType == type;
    }

    /**
     * Check whether the message has a given message type, for a message type
     * enum that has an associated protocol.
     */
    template <typename MessageType, typename = std::enable_if_t<std::is_enum<MessageType>::value>>
    bool HasMessageType(MessageType type) const
    {
        static_assert(std::is_same<std::underlying_type_t<MessageType>, uint8_t>::value, "Enum is wrong size; cast is not safe");
        return HasMessageType(Protocols::MessageTypeTraits<MessageType>::ProtocolId(), static_cast<uint8_t>(type));
    }

    Message & SetMessageType(Protocols::Id protocol, uint8_t type)
    {
        mProtocolID  = protocol;
        mMessageType = type;
        return *this;
    }

    template <typename MessageType, typename = std::enable_if_t<std::is_enum<MessageType>::value>>
    Message & SetMessageType(MessageType type)
    {
        static_assert(std::is_same<std::underlying_type_t<MessageType>, uint8_t>::value, "Enum is wrong size; cast is not safe");
        return SetMessageType(Protocols::MessageTypeTraits<MessageType>::ProtocolId(), static_cast<uint8_t>(type));
    }

    NodeId GetSourceNodeId() const { return mSourceNodeId; }

    Message & SetSourceNodeId(NodeId id)
    {
        mSourceNodeId = id;
        return *this;
    }

    /** Get the raw exchange flags from this message. */
    Header::ExFlags GetExchangeFlags() const { return mExchangeFlags; }

    /** Replace the raw exchange flags. Does not touch the acknowledged counter. */
    Message & SetExchangeFlags(Header::ExFlags flags)
    {
        mExchangeFlags = flags;
        return *this;
    }

    /**
     * Determine whether the initiator of the exchange.
     *
     * @return Returns 'true' if it is the initiator, else 'false'.
     */
    bool IsInitiator() const { return mExchangeFlags.Has(Header::ExFlagValues::kExchangeFlag_Initiator); }

    Message & SetInitiator(bool inInitiator)
    {
        mExchangeFlags.Set(Header::ExFlagValues::kExchangeFlag_Initiator, inInitiator);
        return *this;
    }

    /**
     * Determine whether the current message is an acknowledgment for a
     * previously received message.
     */
    bool IsAckMsg() const { return mExchangeFlags.Has(Header::ExFlagValues::kExchangeFlag_AckMsg); }

    /**
     * Determine whether current message is expecting an acknowledgment
     * from the receiver.
     */
    bool NeedsAck() const { return mExchangeFlags.Has(Header::ExFlagValues::kExchangeFlag_NeedsAck); }

    Message & SetNeedsAck(bool inNeedsAck)
    {
        mExchangeFlags.Set(Header::ExFlagValues::kExchangeFlag_NeedsAck, inNeedsAck);
        return *this;
    }

    const Optional<uint32_t> & GetAckMessageCounter() const { return mAckMessageCounter; }

    /** Marks this message as acknowledging @p counter. */
    Message & SetAckMessageCounter(uint32_t counter)
    {
        mAckMessageCounter.SetValue(counter);
        mExchangeFlags.Set(Header::ExFlagValues::kExchangeFlag_AckMsg);
        return *this;
    }

    bool IsStandaloneAck() const { return HasMessageType(Protocols::SecureChannel::MsgType::StandaloneAck); }

    ByteSpan GetPayload() const { return ByteSpan(mPayload.data(), mPayload.size()); }

    Message & SetPayload(std::vector<uint8_t> && payload)
    {
        mPayload = std::move(payload);
        return *this;
    }

    Message & SetPayload(ByteSpan payload)
    {
        mPayload.assign(payload.begin(), payload.end());
        return *this;
    }

    /** True if the session has already seen this message counter. Inbound only. */
    bool IsDuplicate() const { return mDuplicate; }

    Message & SetDuplicate(bool duplicate)
    {
        mDuplicate = duplicate;
        return *this;
    }

private:
    /// Exchange flags.
    Header::ExFlags mExchangeFlags;

    /// Counter of this message, unique per sending session.
    uint32_t mMessageCounter = 0;

    /// Message counter this message acknowledges, when the ack flag is set.
    Optional<uint32_t> mAckMessageCounter;

    /// Protocol identifier and message type within that protocol.
    Protocols::Id mProtocolID = Protocols::NotSpecified;
    uint8_t mMessageType      = 0;

    /// Exchange ID for this message.
    uint16_t mExchangeID = 0;

    NodeId mSourceNodeId = kUndefinedNodeId;

    std::vector<uint8_t> mPayload;

    bool mDuplicate = false;
};

} // namespace tether
