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
 *      This file defines the classes corresponding to Tether Exchange Context.
 *
 */

#pragma once

#include <lib/core/Optional.h>
#include <lib/core/TetherError.h>
#include <lib/support/Span.h>
#include <messaging/ApplicationPayload.h>
#include <messaging/ExchangeDelegate.h>
#include <messaging/Flags.h>
#include <protocols/Protocols.h>
#include <system/SystemClock.h>
#include <transport/raw/MessageHeader.h>

#include <deque>
#include <memory>
#include <stdint.h>
#include <type_traits>
#include <vector>

namespace tether {
namespace Messaging {

class Session;

/**
 *  @class ExchangeContext
 *
 *  @brief
 *    This class represents a Tether exchange: one request/response
 *    conversation with the peer of a session. It carries the reliability
 *    state of the conversation: the acknowledgement owed to the peer, the
 *    one reliable message waiting for the peer's acknowledgement, and the
 *    payloads queued behind it.
 *
 *    Exchanges are created and owned by their Session. Time driven work
 *    (retransmissions, standalone acknowledgements, draining the payload
 *    queue) happens when the session polls the exchange from ServiceTimers.
 */
class ExchangeContext
{
public:
    ExchangeContext(Session & session, uint16_t exchangeId, bool initiator, ExchangeDelegate * delegate,
                    std::vector<Protocols::Id> protocols);

    ExchangeContext(const ExchangeContext &) = delete;
    ExchangeContext & operator=(const ExchangeContext &) = delete;

    /**
     *  Determine whether the context is the initiator of the exchange.
     *
     *  @return Returns 'true' if it is the initiator, else 'false'.
     */
    bool IsInitiator() const { return mInitiator; }

    uint16_t GetExchangeId() const { return mExchangeId; }

    Session & GetSession() { return mSession; }

    ExchangeDelegate * GetDelegate() const { return mDelegate; }
    void SetDelegate(ExchangeDelegate * delegate) { mDelegate = delegate; }

    const std::vector<Protocols::Id> & GetProtocols() const { return mProtocols; }

    /**
     *  Send a Tether message on this exchange.
     *
     *  The message is sent reliably unless @p sendFlags contains
     *  SendMessageFlags::kNoAutoRequestAck. Only one reliable message may be
     *  outstanding at a time: a reliable send is rejected until the previous
     *  one has been acknowledged. Any acknowledgement owed to the peer is
     *  piggybacked on the message.
     *
     *  @param[in]    protocolId    The protocol identifier of the message to be sent.
     *  @param[in]    msgType       The message type of the corresponding protocol.
     *  @param[in]    payload       The application payload, at most kMaxAppMessageLen bytes.
     *  @param[in]    sendFlags     Flags set by the application for the message being sent.
     *
     *  @retval  #TETHER_ERROR_INCORRECT_STATE    if a reliable message is still unacknowledged,
     *                                            or the exchange is closed.
     *  @retval  #TETHER_ERROR_MESSAGE_TOO_LONG   if the payload does not fit a message.
     *  @retval  other                            errors from the transport.
     *  @retval  #TETHER_NO_ERROR                 if the message was handed to the transport.
     */
    TETHER_ERROR SendMessage(Protocols::Id protocolId, uint8_t msgType, ByteSpan payload,
                             const SendFlags & sendFlags = SendFlags(SendMessageFlags::kNone));

    /**
     * A notational convenience to allow calling SendMessage() with a message
     * type enum value instead of a protocol id and a message type.
     */
    template <typename MessageType, typename = std::enable_if_t<std::is_enum<MessageType>::value>>
    TETHER_ERROR SendMessage(MessageType msgType, ByteSpan payload, const SendFlags & sendFlags = SendFlags(SendMessageFlags::kNone))
    {
        static_assert(std::is_same<std::underlying_type_t<MessageType>, uint8_t>::value, "Enum is wrong size; cast is not safe");
        return SendMessage(Protocols::MessageTypeTraits<MessageType>::ProtocolId(), static_cast<uint8_t>(msgType), payload,
                           sendFlags);
    }

    /**
     *  Send the next message of @p payload, using the payload's own protocol
     *  id and message type.
     *
     *  A chunked payload that still has chunks left after this message is
     *  put back at the front of the pending payload queue; the remaining
     *  chunks are sent one per acknowledgement.
     *
     *  Once the payload has been encoded, a reliable message the transport
     *  rejects is still kept in flight: the transport error is returned and
     *  the message is retransmitted like a lost one.
     */
    TETHER_ERROR SendMessage(std::unique_ptr<ApplicationPayload> payload,
                             const SendFlags & sendFlags = SendFlags(SendMessageFlags::kNone));

    /**
     *  Same as above, with an explicit protocol id and message type
     *  overriding the payload's.
     */
    TETHER_ERROR SendMessage(std::unique_ptr<ApplicationPayload> payload, Protocols::Id protocolId, uint8_t msgType,
                             const SendFlags & sendFlags = SendFlags(SendMessageFlags::kNone));

    /**
     *  Appends @p payload to the pending payload queue. Queued payloads are
     *  sent reliably, in order, whenever no reliable message is in flight.
     */
    void Queue(std::unique_ptr<ApplicationPayload> payload);

    /**
     *  Sends the payload at the head of the queue if nothing is in flight.
     *  The payload leaves the queue once its last chunk has been sent.
     */
    TETHER_ERROR SendPendingPayload();

    /**
     *  Flush the owed acknowledgement.
     *
     *  With a reliable message in flight that already carries every ack we
     *  owe, that message is resent as is. Otherwise an unreliable, empty
     *  standalone acknowledgement message is sent.
     */
    TETHER_ERROR SendStandaloneAckMessage();

    /**
     *  Updates the reliability state of the exchange for an inbound message.
     *
     *  @return true if the message must not be delivered to the application.
     */
    bool HandleMessage(const Message & message);

    /**
     *  Close the exchange.
     *
     *  With a reliable message still unacknowledged the exchange only becomes
     *  closing: the message is resent and the exchange goes away once it is
     *  acknowledged or abandoned. Otherwise the exchange is removed from its
     *  session right away, after flushing any owed acknowledgement.
     */
    void Close();

    /**
     *  Retransmits the in-flight reliable message once its deadline has
     *  passed, and abandons the exchange after kMaxRetransmissions
     *  retransmissions.
     *
     *  @retval  #TETHER_ERROR_MESSAGE_NOT_ACKNOWLEDGED if the exchange was abandoned.
     */
    TETHER_ERROR ResendPending();

    /**
     *  Sends the owed acknowledgement as a standalone message once its
     *  piggyback window has passed.
     */
    TETHER_ERROR FlushPendingAck();

    uint8_t GetRetransmitCount() const { return mRetransmitCount; }

    /// True if an acknowledgement is owed to the peer.
    bool IsAckPending() const { return mPendingPeerAckMessageCounter.HasValue(); }

    const Optional<uint32_t> & GetPendingPeerAckMessageCounter() const { return mPendingPeerAckMessageCounter; }
    const Optional<System::Clock::Timestamp> & GetNextAckTime() const { return mNextAckTime; }

    bool HasPendingRetransmission() const { return mPendingRetransmission.HasValue(); }
    const Optional<Message> & GetPendingRetransmission() const { return mPendingRetransmission; }
    const Optional<System::Clock::Timestamp> & GetNextRetransmissionTime() const { return mNextRetransTime; }

    size_t PendingPayloadCount() const { return mPendingPayloads.size(); }

    bool IsClosing() const { return mClosing; }
    bool IsClosed() const { return mClosed; }

private:
    TETHER_ERROR SendMessageImpl(Protocols::Id protocolId, uint8_t msgType, ByteSpan payload, bool reliable);

    // Encodes the next message of @p payload and sends it. @p consumed tells
    // whether EncodeInto was called, i.e. whether the payload advanced.
    TETHER_ERROR SendPayloadImpl(ApplicationPayload & payload, Protocols::Id protocolId, uint8_t msgType, bool reliable,
                                 bool & consumed);

    TETHER_ERROR CheckCanSend(bool reliable) const;
    Message BuildMessage(uint32_t messageCounter, Protocols::Id protocolId, uint8_t msgType, ByteSpan payload, bool reliable) const;

    // Takes over the owed ack carried by @p message and, if reliable, installs it as the in-flight message.
    void CommitSentMessage(Message && message, bool reliable);

    // Hands the in-flight reliable message to the session again, unchanged.
    TETHER_ERROR ResendPendingMessage();

    // True when resending the in-flight message would deliver every ack we owe.
    bool PendingRetransmissionCarriesOwedAck() const;

    bool IsProtocolAccepted(Protocols::Id protocolId) const;

    void SetPendingPeerAck(uint32_t messageCounter, System::Clock::Timestamp deadline);
    void ClearPendingPeerAck();

    void ClearPendingRetransmission();

    // Flushes owed acks, notifies the delegate and deregisters from the session.
    void DoClose();

    Session & mSession;
    ExchangeDelegate * mDelegate = nullptr;

    const uint16_t mExchangeId;
    const bool mInitiator;
    const std::vector<Protocols::Id> mProtocols;

    // Acknowledgement owed to the peer and the deadline to send it standalone.
    // Set and cleared together.
    Optional<uint32_t> mPendingPeerAckMessageCounter;
    Optional<System::Clock::Timestamp> mNextAckTime;

    // The reliable message in flight and the deadline of its next transmission.
    Optional<Message> mPendingRetransmission;
    Optional<System::Clock::Timestamp> mNextRetransTime;
    uint8_t mRetransmitCount = 0;

    std::deque<std::unique_ptr<ApplicationPayload>> mPendingPayloads;

    bool mClosing = false;
    bool mClosed  = false;
};

} // namespace Messaging
} // namespace tether

/**
 * Logging helpers for exchanges.
 */
#define TetherLogFormatExchange TetherLogFormatExchangeId
#define TetherLogValueExchange(ec) TetherLogValueExchangeId((ec)->GetExchangeId(), (ec)->IsInitiator())
