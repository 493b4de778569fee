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
 *      This file implements the Session class.
 */

#include <messaging/Session.h>

#include <crypto/RandUtils.h>
#include <lib/support/CodeUtils.h>
#include <lib/support/logging/TetherLogging.h>

#include <algorithm>
#include <inttypes.h>

namespace tether {
namespace Messaging {

Session::Session(Transport::Base & transport, NodeId localNodeId, NodeId peerNodeId) :
    mTransport(transport), mLocalNodeId(localNodeId), mPeerNodeId(peerNodeId), mNextExchangeId(Crypto::GetRandU16()),
    mRemoteMRPConfig(GetLocalMRPConfig().ValueOr(GetDefaultMRPConfig()))
{
    mLocalMessageCounter.InitWithRandom();
}

Session::~Session()
{
    // Exchanges are destroyed without callbacks; the peer is not told.
    mReleasedExchanges.clear();
    mInitiatorExchanges.clear();
    mResponderExchanges.clear();
}

ExchangeContext * Session::NewExchange(ExchangeDelegate * delegate, Protocols::Id protocol)
{
    return NewExchange(delegate, std::vector<Protocols::Id>{ protocol });
}

ExchangeContext * Session::NewExchange(ExchangeDelegate * delegate, std::vector<Protocols::Id> protocols)
{
    // Ids wrap around; skip any still used by a live initiator exchange.
    for (size_t attempts = 0; attempts <= UINT16_MAX; attempts++)
    {
        uint16_t exchangeId = mNextExchangeId++;
        if (mInitiatorExchanges.find(exchangeId) == mInitiatorExchanges.end())
        {
            return CreateExchange(exchangeId, true, delegate, std::move(protocols));
        }
    }

    TetherLogError(ExchangeManager, "No exchange id available");
    return nullptr;
}

ExchangeContext * Session::CreateExchange(uint16_t exchangeId, bool initiator, ExchangeDelegate * delegate,
                                          std::vector<Protocols::Id> protocols)
{
    auto ec                  = std::make_unique<ExchangeContext>(*this, exchangeId, initiator, delegate, std::move(protocols));
    ExchangeContext * result = ec.get();
    Registry(initiator)[exchangeId] = std::move(ec);
    return result;
}

TETHER_ERROR Session::RegisterUnsolicitedMessageHandlerForProtocol(Protocols::Id protocolId, UnsolicitedMessageHandler * handler)
{
    VerifyOrReturnError(handler != nullptr, TETHER_ERROR_INVALID_ARGUMENT);

    for (auto & slot : mUnsolicitedMessageHandlers)
    {
        if (slot.protocolId == protocolId)
        {
            slot.handler = handler;
            return TETHER_NO_ERROR;
        }
    }

    mUnsolicitedMessageHandlers.emplace_back(protocolId, handler);
    return TETHER_NO_ERROR;
}

TETHER_ERROR Session::UnregisterUnsolicitedMessageHandlerForProtocol(Protocols::Id protocolId)
{
    auto it = std::find_if(mUnsolicitedMessageHandlers.begin(), mUnsolicitedMessageHandlers.end(),
                           [protocolId](const UnsolicitedMessageHandlerSlot & slot) { return slot.protocolId == protocolId; });
    VerifyOrReturnError(it != mUnsolicitedMessageHandlers.end(), TETHER_ERROR_KEY_NOT_FOUND);

    mUnsolicitedMessageHandlers.erase(it);
    return TETHER_NO_ERROR;
}

UnsolicitedMessageHandler * Session::FindUnsolicitedMessageHandler(Protocols::Id protocolId) const
{
    for (const auto & slot : mUnsolicitedMessageHandlers)
    {
        if (slot.protocolId == protocolId)
        {
            return slot.handler;
        }
    }
    return nullptr;
}

void Session::OnMessageReceived(Message && message)
{
    mLastPeerActivityTime.SetValue(System::SystemClock().GetMonotonicTimestamp());

    uint32_t messageCounter = message.GetMessageCounter();
    TETHER_ERROR err        = mPeerMessageCounter.VerifyOrTrustFirst(messageCounter);
    if (err == TETHER_ERROR_DUPLICATE_MESSAGE_RECEIVED)
    {
        message.SetDuplicate(true);
    }
    else if (err != TETHER_NO_ERROR)
    {
        TetherLogError(ExchangeManager, "Message counter verify failed: %" TETHER_ERROR_FORMAT, err.Format());
        return;
    }
    else
    {
        mPeerMessageCounter.Commit(messageCounter);
    }

    TetherLogDetail(ExchangeManager,
                    ">>> [E:" TetherLogFormatExchangeId " M:" TetherLogFormatMessageCounter "%s] (%s) Msg RX from " TetherLogFormatX64
                    " type %s:%s",
                    TetherLogValueExchangeId(message.GetExchangeID(), !message.IsInitiator()), messageCounter,
                    message.IsDuplicate() ? " (dup)" : "", message.IsAckMsg() ? "A" : "-", TetherLogValueX64(message.GetSourceNodeId()),
                    Protocols::GetProtocolName(message.GetProtocolID()),
                    Protocols::GetMessageTypeName(message.GetProtocolID(), message.GetMessageType()));

    // A message sent by the peer's initiator lands on one of our responder exchanges, and vice versa.
    bool initiator      = !message.IsInitiator();
    ExchangeContext * ec = FindExchange(message.GetExchangeID(), initiator);

    if (ec == nullptr)
    {
        UnsolicitedMessageHandler * handler = nullptr;
        if (message.IsInitiator() && !message.IsDuplicate())
        {
            handler = FindUnsolicitedMessageHandler(message.GetProtocolID());
        }

        ExchangeDelegate * delegate = nullptr;
        if (handler != nullptr)
        {
            err = handler->OnUnsolicitedMessageReceived(message, delegate);
            if (err != TETHER_NO_ERROR)
            {
                TetherLogError(ExchangeManager, "Unsolicited message handler refused message: %" TETHER_ERROR_FORMAT,
                               err.Format());
                delegate = nullptr;
            }
        }

        if (delegate == nullptr)
        {
            if (message.NeedsAck())
            {
                SendEphemeralAck(message);
            }
            else
            {
                TetherLogDetail(ExchangeManager, "Dropping message for unknown exchange " TetherLogFormatExchangeId,
                                TetherLogValueExchangeId(message.GetExchangeID(), initiator));
            }
            ReleaseClosedExchanges();
            return;
        }

        ec = CreateExchange(message.GetExchangeID(), false, delegate, std::vector<Protocols::Id>{ message.GetProtocolID() });
        TetherLogDetail(ExchangeManager, "Handling via exchange: " TetherLogFormatExchange, TetherLogValueExchange(ec));
    }

    bool drop = ec->HandleMessage(message);
    if (!drop && !message.IsStandaloneAck())
    {
        ExchangeDelegate * delegate = ec->GetDelegate();
        if (delegate != nullptr)
        {
            err = delegate->OnMessageReceived(ec, message);
            if (err != TETHER_NO_ERROR)
            {
                TetherLogError(ExchangeManager, "OnMessageReceived failed, err = %" TETHER_ERROR_FORMAT, err.Format());
            }
        }
    }

    ReleaseClosedExchanges();
}

void Session::SendEphemeralAck(const Message & message)
{
    // The exchange only lives for the ack: it takes the message, then closes,
    // which flushes the owed ack and deregisters it.
    bool initiator = !message.IsInitiator();
    ExchangeContext * ec =
        CreateExchange(message.GetExchangeID(), initiator, nullptr, std::vector<Protocols::Id>{ message.GetProtocolID() });

    TetherLogDetail(ExchangeManager, "Generating StandaloneAck via ephemeral exchange " TetherLogFormatExchange,
                    TetherLogValueExchange(ec));

    ec->HandleMessage(message);
    ec->Close();
}

void Session::ServiceTimers()
{
    std::vector<ExchangeContext *> exchanges;
    exchanges.reserve(GetNumActiveExchanges());
    for (const auto & entry : mInitiatorExchanges)
    {
        exchanges.push_back(entry.second.get());
    }
    for (const auto & entry : mResponderExchanges)
    {
        exchanges.push_back(entry.second.get());
    }

    // Deregistered exchanges stay alive until ReleaseClosedExchanges(), so the snapshot stays valid.
    for (ExchangeContext * ec : exchanges)
    {
        if (!ec->IsClosed())
        {
            TETHER_ERROR err = ec->ResendPending();
            if (err != TETHER_NO_ERROR && err != TETHER_ERROR_MESSAGE_NOT_ACKNOWLEDGED)
            {
                TetherLogError(ExchangeManager, "Retransmission on exchange " TetherLogFormatExchange " failed: %" TETHER_ERROR_FORMAT,
                               TetherLogValueExchange(ec), err.Format());
            }
        }
        if (!ec->IsClosed())
        {
            LogErrorOnFailure(ec->FlushPendingAck());
        }
        if (!ec->IsClosed())
        {
            LogErrorOnFailure(ec->SendPendingPayload());
        }
    }

    ReleaseClosedExchanges();
}

TETHER_ERROR Session::SendMessage(const Message & message)
{
    TetherLogDetail(ExchangeManager,
                    "<<< [E:" TetherLogFormatExchangeId " M:" TetherLogFormatMessageCounter "] (%s%s) Msg TX to " TetherLogFormatX64
                    " type %s:%s",
                    TetherLogValueExchangeId(message.GetExchangeID(), message.IsInitiator()), message.GetMessageCounter(),
                    message.IsAckMsg() ? "A" : "-", message.NeedsAck() ? "R" : "-", TetherLogValueX64(mPeerNodeId),
                    Protocols::GetProtocolName(message.GetProtocolID()),
                    Protocols::GetMessageTypeName(message.GetProtocolID(), message.GetMessageType()));

    return mTransport.SendMessage(message);
}

TETHER_ERROR Session::AllocateMessageCounter(uint32_t & counter)
{
    return mLocalMessageCounter.AdvanceAndConsume(counter);
}

void Session::Deregister(uint16_t exchangeId, bool initiator)
{
    ExchangeMap & registry = Registry(initiator);
    auto it                = registry.find(exchangeId);
    VerifyOrReturn(it != registry.end());

    mReleasedExchanges.push_back(std::move(it->second));
    registry.erase(it);
}

ExchangeContext * Session::FindExchange(uint16_t exchangeId, bool initiator) const
{
    const ExchangeMap & registry = Registry(initiator);
    auto it                      = registry.find(exchangeId);
    return (it == registry.end()) ? nullptr : it->second.get();
}

bool Session::IsPeerActive() const
{
    VerifyOrReturnValue(mLastPeerActivityTime.HasValue(), false);

    System::Clock::Timestamp now = System::SystemClock().GetMonotonicTimestamp();
    return (now - mLastPeerActivityTime.Value()) < mRemoteMRPConfig.mActiveThresholdTime;
}

System::Clock::Timeout Session::GetMRPBaseTimeout() const
{
    return IsPeerActive() ? mRemoteMRPConfig.mActiveRetransTimeout : mRemoteMRPConfig.mIdleRetransTimeout;
}

} // namespace Messaging
} // namespace tether
