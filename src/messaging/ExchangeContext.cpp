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
 *      This file implements the ExchangeContext class: sending, receiving,
 *      acknowledging and retransmitting the messages of one exchange.
 *
 */

#include <messaging/ExchangeContext.h>

#include <lib/support/CodeUtils.h>
#include <lib/support/logging/TetherLogging.h>
#include <messaging/ReliableMessageProtocolConfig.h>
#include <messaging/Session.h>
#include <protocols/secure_channel/Constants.h>

#include <algorithm>
#include <inttypes.h>

namespace tether {
namespace Messaging {

ExchangeContext::ExchangeContext(Session & session, uint16_t exchangeId, bool initiator, ExchangeDelegate * delegate,
                                 std::vector<Protocols::Id> protocols) :
    mSession(session),
    mDelegate(delegate), mExchangeId(exchangeId), mInitiator(initiator), mProtocols(std::move(protocols))
{
    TetherLogDetail(ExchangeManager, "ec++ id: " TetherLogFormatExchange, TetherLogValueExchange(this));
}

TETHER_ERROR ExchangeContext::SendMessage(Protocols::Id protocolId, uint8_t msgType, ByteSpan payload, const SendFlags & sendFlags)
{
    return SendMessageImpl(protocolId, msgType, payload, !sendFlags.Has(SendMessageFlags::kNoAutoRequestAck));
}

TETHER_ERROR ExchangeContext::SendMessage(std::unique_ptr<ApplicationPayload> payload, const SendFlags & sendFlags)
{
    VerifyOrReturnError(payload != nullptr, TETHER_ERROR_INVALID_ARGUMENT);

    Protocols::Id protocolId = payload->GetProtocolId();
    uint8_t msgType          = payload->GetMessageType();
    return SendMessage(std::move(payload), protocolId, msgType, sendFlags);
}

TETHER_ERROR ExchangeContext::SendMessage(std::unique_ptr<ApplicationPayload> payload, Protocols::Id protocolId, uint8_t msgType,
                                          const SendFlags & sendFlags)
{
    VerifyOrReturnError(payload != nullptr, TETHER_ERROR_INVALID_ARGUMENT);

    bool reliable    = !sendFlags.Has(SendMessageFlags::kNoAutoRequestAck);
    bool consumed    = false;
    TETHER_ERROR err = SendPayloadImpl(*payload, protocolId, msgType, reliable, consumed);
    if (consumed && payload->HasMoreChunks())
    {
        mPendingPayloads.push_front(std::move(payload));
    }
    return err;
}

TETHER_ERROR ExchangeContext::SendPayloadImpl(ApplicationPayload & payload, Protocols::Id protocolId, uint8_t msgType, bool reliable,
                                              bool & consumed)
{
    consumed = false;

    // Everything that may refuse the send runs before the payload is encoded.
    ReturnErrorOnFailure(CheckCanSend(reliable));

    uint32_t messageCounter;
    ReturnErrorOnFailure(mSession.AllocateMessageCounter(messageCounter));

    uint8_t buffer[kMaxAppMessageLen];
    MutableByteSpan encoded(buffer);
    consumed = true;
    ReturnErrorOnFailure(payload.EncodeInto(encoded));

    Message message = BuildMessage(messageCounter, protocolId, msgType, encoded, reliable);

    // The chunk is gone from the payload now: a reliable message the transport
    // failed to take is kept in flight and recovered by retransmission.
    TETHER_ERROR err = mSession.SendMessage(message);
    if (err != TETHER_NO_ERROR)
    {
        TetherLogError(ExchangeManager,
                       "Transport failed MessageCounter:" TetherLogFormatMessageCounter " on exchange " TetherLogFormatExchange
                       ": %" TETHER_ERROR_FORMAT,
                       messageCounter, TetherLogValueExchange(this), err.Format());
        VerifyOrReturnError(reliable, err);
    }

    CommitSentMessage(std::move(message), reliable);
    return err;
}

TETHER_ERROR ExchangeContext::SendMessageImpl(Protocols::Id protocolId, uint8_t msgType, ByteSpan payload, bool reliable)
{
    ReturnErrorOnFailure(CheckCanSend(reliable));
    VerifyOrReturnError(payload.size() <= kMaxAppMessageLen, TETHER_ERROR_MESSAGE_TOO_LONG);

    uint32_t messageCounter;
    ReturnErrorOnFailure(mSession.AllocateMessageCounter(messageCounter));

    Message message = BuildMessage(messageCounter, protocolId, msgType, payload, reliable);
    ReturnErrorOnFailure(mSession.SendMessage(message));

    CommitSentMessage(std::move(message), reliable);
    return TETHER_NO_ERROR;
}

TETHER_ERROR ExchangeContext::CheckCanSend(bool reliable) const
{
    // A closed exchange may still emit unreliable acks, never new reliable traffic.
    VerifyOrReturnError(!(reliable && mClosed), TETHER_ERROR_INCORRECT_STATE);

    if (reliable && mPendingRetransmission.HasValue())
    {
        TetherLogError(ExchangeManager,
                       "Reliable send rejected on exchange " TetherLogFormatExchange
                       ": MessageCounter:" TetherLogFormatMessageCounter " is still unacknowledged",
                       TetherLogValueExchange(this), mPendingRetransmission.Value().GetMessageCounter());
        return TETHER_ERROR_INCORRECT_STATE;
    }

    return TETHER_NO_ERROR;
}

Message ExchangeContext::BuildMessage(uint32_t messageCounter, Protocols::Id protocolId, uint8_t msgType, ByteSpan payload,
                                      bool reliable) const
{
    Message message;
    message.SetMessageCounter(messageCounter)
        .SetExchangeID(mExchangeId)
        .SetMessageType(protocolId, msgType)
        .SetSourceNodeId(mSession.GetLocalNodeId())
        .SetInitiator(mInitiator)
        .SetNeedsAck(reliable)
        .SetPayload(payload);

    if (mPendingPeerAckMessageCounter.HasValue())
    {
        message.SetAckMessageCounter(mPendingPeerAckMessageCounter.Value());
    }
    return message;
}

void ExchangeContext::CommitSentMessage(Message && message, bool reliable)
{
    if (message.IsAckMsg())
    {
        TetherLogDetail(ExchangeManager,
                        "Piggybacking Ack for MessageCounter:" TetherLogFormatMessageCounter " on exchange " TetherLogFormatExchange,
                        message.GetAckMessageCounter().Value(), TetherLogValueExchange(this));
        ClearPendingPeerAck();
    }

    if (reliable)
    {
        System::Clock::Timestamp now = System::SystemClock().GetMonotonicTimestamp();
        mRetransmitCount             = 0;
        mNextRetransTime.SetValue(now + GetRetransmissionBackoff(mSession.GetMRPBaseTimeout(), mRetransmitCount));
        mPendingRetransmission.SetValue(std::move(message));
    }
}

void ExchangeContext::Queue(std::unique_ptr<ApplicationPayload> payload)
{
    VerifyOrReturn(payload != nullptr);
    mPendingPayloads.push_back(std::move(payload));
}

TETHER_ERROR ExchangeContext::SendPendingPayload()
{
    VerifyOrReturnError(!mClosed && !mPendingRetransmission.HasValue() && !mPendingPayloads.empty(), TETHER_NO_ERROR);

    ApplicationPayload & payload = *mPendingPayloads.front();
    bool consumed                = false;
    TETHER_ERROR err = SendPayloadImpl(payload, payload.GetProtocolId(), payload.GetMessageType(), true, consumed);
    if (consumed && !payload.HasMoreChunks())
    {
        mPendingPayloads.pop_front();
    }
    return err;
}

TETHER_ERROR ExchangeContext::SendStandaloneAckMessage()
{
    if (mPendingRetransmission.HasValue() && PendingRetransmissionCarriesOwedAck())
    {
        return ResendPendingMessage();
    }

    return SendMessageImpl(Protocols::SecureChannel::Id, to_underlying(Protocols::SecureChannel::MsgType::StandaloneAck), ByteSpan(),
                           false);
}

TETHER_ERROR ExchangeContext::ResendPendingMessage()
{
    VerifyOrReturnError(mPendingRetransmission.HasValue(), TETHER_ERROR_INCORRECT_STATE);

    const Message & message = mPendingRetransmission.Value();
    ReturnErrorOnFailure(mSession.SendMessage(message));

    if (mPendingPeerAckMessageCounter.HasValue() && message.GetAckMessageCounter() == mPendingPeerAckMessageCounter)
    {
        ClearPendingPeerAck();
    }
    return TETHER_NO_ERROR;
}

bool ExchangeContext::PendingRetransmissionCarriesOwedAck() const
{
    return !mPendingPeerAckMessageCounter.HasValue() ||
        mPendingRetransmission.Value().GetAckMessageCounter() == mPendingPeerAckMessageCounter;
}

bool ExchangeContext::IsProtocolAccepted(Protocols::Id protocolId) const
{
    return std::find(mProtocols.begin(), mProtocols.end(), protocolId) != mProtocols.end();
}

void ExchangeContext::SetPendingPeerAck(uint32_t messageCounter, System::Clock::Timestamp deadline)
{
    mPendingPeerAckMessageCounter.SetValue(messageCounter);
    mNextAckTime.SetValue(deadline);
}

void ExchangeContext::ClearPendingPeerAck()
{
    mPendingPeerAckMessageCounter.ClearValue();
    mNextAckTime.ClearValue();
}

void ExchangeContext::ClearPendingRetransmission()
{
    mPendingRetransmission.ClearValue();
    mNextRetransTime.ClearValue();
    mRetransmitCount = 0;
}

bool ExchangeContext::HandleMessage(const Message & message)
{
    System::Clock::Timestamp now = System::SystemClock().GetMonotonicTimestamp();

    if (message.IsAckMsg())
    {
        const Optional<uint32_t> & ackCounter = message.GetAckMessageCounter();
        if (!ackCounter.HasValue())
        {
            TetherLogError(ExchangeManager, "Dropping ack without a message counter on exchange " TetherLogFormatExchange,
                           TetherLogValueExchange(this));
            return true;
        }

        if (mPendingRetransmission.HasValue())
        {
            uint32_t pendingCounter = mPendingRetransmission.Value().GetMessageCounter();
            if (pendingCounter != ackCounter.Value())
            {
                TetherLogError(ExchangeManager,
                               "Dropping ack for MessageCounter:" TetherLogFormatMessageCounter
                               " on exchange " TetherLogFormatExchange ", expected " TetherLogFormatMessageCounter,
                               ackCounter.Value(), TetherLogValueExchange(this), pendingCounter);
                return true;
            }

            TetherLogDetail(ExchangeManager,
                            "Rxd Ack; Removing MessageCounter:" TetherLogFormatMessageCounter
                            " from Retrans Table on exchange " TetherLogFormatExchange,
                            pendingCounter, TetherLogValueExchange(this));
            ClearPendingRetransmission();

            if (mClosing && mPendingPayloads.empty())
            {
                DoClose();
            }
        }
    }

    if (mClosed)
    {
        // Nobody listens any more, but a reliable message must still be acked.
        if (message.NeedsAck())
        {
            SetPendingPeerAck(message.GetMessageCounter(), now);
            LogErrorOnFailure(SendStandaloneAckMessage());
        }
        return true;
    }

    if (!IsProtocolAccepted(message.GetProtocolID()))
    {
        TetherLogDetail(ExchangeManager, "Dropping %s message on exchange " TetherLogFormatExchange,
                        Protocols::GetProtocolName(message.GetProtocolID()), TetherLogValueExchange(this));
        return true;
    }

    if (message.NeedsAck())
    {
        uint32_t messageCounter = message.GetMessageCounter();

        if (message.IsDuplicate())
        {
            TetherLogDetail(ExchangeManager,
                            "Forcing tx of solitary ack for duplicate MessageCounter:" TetherLogFormatMessageCounter
                            " on exchange " TetherLogFormatExchange,
                            messageCounter, TetherLogValueExchange(this));
            if (mPendingPeerAckMessageCounter.HasValue() && mPendingPeerAckMessageCounter.Value() != messageCounter)
            {
                LogErrorOnFailure(SendStandaloneAckMessage());
            }
            SetPendingPeerAck(messageCounter, now);
            LogErrorOnFailure(SendStandaloneAckMessage());
        }
        else
        {
            // An ack never gets coalesced away: flush the one we owe before taking a new one.
            if (mPendingPeerAckMessageCounter.HasValue())
            {
                TetherLogDetail(ExchangeManager,
                                "Flushing pending ack for MessageCounter:" TetherLogFormatMessageCounter
                                " on exchange " TetherLogFormatExchange,
                                mPendingPeerAckMessageCounter.Value(), TetherLogValueExchange(this));
                LogErrorOnFailure(SendStandaloneAckMessage());
            }
            SetPendingPeerAck(messageCounter, now + kStandaloneAckTimeout);
        }
    }

    return message.IsDuplicate();
}

void ExchangeContext::Close()
{
    VerifyOrReturn(!mClosed);

    TetherLogDetail(ExchangeManager, "ec - close[" TetherLogFormatExchange "]", TetherLogValueExchange(this));
    mClosing = true;

    if (mPendingRetransmission.HasValue())
    {
        // The acknowledgement of the in-flight message completes the close.
        if (!PendingRetransmissionCarriesOwedAck())
        {
            LogErrorOnFailure(SendStandaloneAckMessage());
        }
        LogErrorOnFailure(ResendPendingMessage());
        return;
    }

    if (!mPendingPayloads.empty())
    {
        LogErrorOnFailure(SendPendingPayload());
        VerifyOrReturn(!mPendingRetransmission.HasValue());
    }

    DoClose();
}

void ExchangeContext::DoClose()
{
    VerifyOrReturn(!mClosed);

    ClearPendingRetransmission();
    mPendingPayloads.clear();

    if (mPendingPeerAckMessageCounter.HasValue())
    {
        LogErrorOnFailure(SendStandaloneAckMessage());
    }

    mClosing = true;
    mClosed  = true;

    TetherLogDetail(ExchangeManager, "ec-- id: " TetherLogFormatExchange, TetherLogValueExchange(this));

    ExchangeDelegate * delegate = mDelegate;
    mDelegate                   = nullptr;
    if (delegate != nullptr)
    {
        delegate->OnExchangeClosing(this);
    }

    mSession.Deregister(mExchangeId, mInitiator);
}

TETHER_ERROR ExchangeContext::ResendPending()
{
    VerifyOrReturnError(!mClosed && mPendingRetransmission.HasValue() && mNextRetransTime.HasValue(), TETHER_NO_ERROR);

    System::Clock::Timestamp now = System::SystemClock().GetMonotonicTimestamp();
    VerifyOrReturnError(now >= mNextRetransTime.Value(), TETHER_NO_ERROR);

    if (mRetransmitCount + 1 > kMaxRetransmissions)
    {
        TetherLogError(ExchangeManager,
                       "Failed to Send Tether MessageCounter:" TetherLogFormatMessageCounter " on exchange " TetherLogFormatExchange
                       " sendCount: %u max retries: %u",
                       mPendingRetransmission.Value().GetMessageCounter(), TetherLogValueExchange(this),
                       static_cast<unsigned>(mRetransmitCount), static_cast<unsigned>(kMaxRetransmissions));

        ClearPendingRetransmission();
        if (mDelegate != nullptr)
        {
            mDelegate->OnDeliveryFailure(this, TETHER_ERROR_MESSAGE_NOT_ACKNOWLEDGED);
        }
        DoClose();
        return TETHER_ERROR_MESSAGE_NOT_ACKNOWLEDGED;
    }

    mRetransmitCount++;
    mNextRetransTime.SetValue(now + GetRetransmissionBackoff(mSession.GetMRPBaseTimeout(), mRetransmitCount));

    TetherLogDetail(ExchangeManager,
                    "Retransmitting MessageCounter:" TetherLogFormatMessageCounter " on exchange " TetherLogFormatExchange
                    " Send Cnt %u",
                    mPendingRetransmission.Value().GetMessageCounter(), TetherLogValueExchange(this),
                    static_cast<unsigned>(mRetransmitCount));

    return ResendPendingMessage();
}

TETHER_ERROR ExchangeContext::FlushPendingAck()
{
    VerifyOrReturnError(!mClosed && mNextAckTime.HasValue(), TETHER_NO_ERROR);

    System::Clock::Timestamp now = System::SystemClock().GetMonotonicTimestamp();
    VerifyOrReturnError(now >= mNextAckTime.Value(), TETHER_NO_ERROR);

    TetherLogDetail(ExchangeManager,
                    "Sending Standalone Ack for MessageCounter:" TetherLogFormatMessageCounter " on exchange " TetherLogFormatExchange,
                    mPendingPeerAckMessageCounter.Value(), TetherLogValueExchange(this));

    return SendStandaloneAckMessage();
}

} // namespace Messaging
} // namespace tether
