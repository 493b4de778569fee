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
 *      This file defines the payloads an exchange can send: a plain payload
 *      carried by a single message, and a chunked payload that is spread over
 *      as many messages as needed.
 */

#pragma once

#include <lib/core/TetherError.h>
#include <lib/support/Span.h>
#include <protocols/Protocols.h>

#include <stdint.h>
#include <type_traits>
#include <vector>

namespace tether {
namespace Messaging {

class ApplicationPayload
{
public:
    virtual ~ApplicationPayload() = default;

    virtual Protocols::Id GetProtocolId() const = 0;
    virtual uint8_t GetMessageType() const      = 0;

    /**
     * Encodes the next message's worth of payload into @p buffer.
     *
     * On success @p buffer is reduced to the number of bytes written.
     */
    virtual TETHER_ERROR EncodeInto(MutableByteSpan & buffer) = 0;

    virtual bool IsChunked() const { return false; }

    /// True while a chunked payload still has bytes left after the last EncodeInto.
    virtual bool HasMoreChunks() const { return false; }
};

/**
 * A payload sent as one message. Fails to encode if it does not fit.
 */
class PlainPayload : public ApplicationPayload
{
public:
    PlainPayload(Protocols::Id protocolId, uint8_t messageType, std::vector<uint8_t> && data) :
        mProtocolId(protocolId), mMessageType(messageType), mData(std::move(data))
    {}

    template <typename MessageType, typename = std::enable_if_t<std::is_enum<MessageType>::value>>
    PlainPayload(MessageType messageType, std::vector<uint8_t> && data) :
        PlainPayload(Protocols::MessageTypeTraits<MessageType>::ProtocolId(), static_cast<uint8_t>(messageType), std::move(data))
    {}

    Protocols::Id GetProtocolId() const override { return mProtocolId; }
    uint8_t GetMessageType() const override { return mMessageType; }

    TETHER_ERROR EncodeInto(MutableByteSpan & buffer) override;

private:
    Protocols::Id mProtocolId;
    uint8_t mMessageType;
    std::vector<uint8_t> mData;
};

/**
 * A payload too large for one message. Each EncodeInto call produces the
 * next chunk; the exchange keeps re-queueing the payload until
 * HasMoreChunks() returns false.
 */
class ChunkedPayload : public ApplicationPayload
{
public:
    bool IsChunked() const override { return true; }
    bool HasMoreChunks() const override = 0;
};

/**
 * A chunked payload over a contiguous byte buffer, cut into consecutive
 * slices of at most the buffer size handed to EncodeInto.
 */
class ByteChunkedPayload : public ChunkedPayload
{
public:
    ByteChunkedPayload(Protocols::Id protocolId, uint8_t messageType, std::vector<uint8_t> && data) :
        mProtocolId(protocolId), mMessageType(messageType), mData(std::move(data))
    {}

    template <typename MessageType, typename = std::enable_if_t<std::is_enum<MessageType>::value>>
    ByteChunkedPayload(MessageType messageType, std::vector<uint8_t> && data) :
        ByteChunkedPayload(Protocols::MessageTypeTraits<MessageType>::ProtocolId(), static_cast<uint8_t>(messageType),
                           std::move(data))
    {}

    Protocols::Id GetProtocolId() const override { return mProtocolId; }
    uint8_t GetMessageType() const override { return mMessageType; }

    TETHER_ERROR EncodeInto(MutableByteSpan & buffer) override;
    bool HasMoreChunks() const override { return mOffset < mData.size(); }

    size_t GetEncodedLength() const { return mOffset; }

private:
    Protocols::Id mProtocolId;
    uint8_t mMessageType;
    std::vector<uint8_t> mData;
    size_t mOffset = 0;
};

} // namespace Messaging
} // namespace tether
