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
 *      This file defines the Session class: the exchanges opened with one
 *      peer, the message counters of the link, and the dispatch of inbound
 *      messages to exchanges.
 */

#pragma once

#include <lib/core/Optional.h>
#include <lib/core/TetherError.h>
#include <messaging/ExchangeContext.h>
#include <messaging/ExchangeDelegate.h>
#include <messaging/ReliableMessageProtocolConfig.h>
#include <protocols/Protocols.h>
#include <system/SystemClock.h>
#include <transport/MessageCounter.h>
#include <transport/PeerMessageCounter.h>
#include <transport/raw/Base.h>
#include <transport/raw/MessageHeader.h>

#include <map>
#include <memory>
#include <stdint.h>
#include <vector>

namespace tether {
namespace Messaging {

/**
 *  @class Session
 *
 *  @brief
 *    Owns every exchange opened with one peer, in two registries keyed by
 *    exchange id: exchanges initiated locally and exchanges initiated by
 *    the peer. Inbound messages are routed by their initiator flag and
 *    exchange id.
 *
 *    The session is driven from a single event loop: the transport calls
 *    OnMessageReceived() for every inbound message and the loop calls
 *    ServiceTimers() periodically. Exchanges closed during either call are
 *    released when the call returns.
 */
class Session
{
public:
    Session(Transport::Base & transport, NodeId localNodeId, NodeId peerNodeId);
    ~Session();

    Session(const Session &) = delete;
    Session & operator=(const Session &) = delete;

    /**
     *  Creates a new initiator exchange accepting messages of @p protocol.
     *
     *  @return A pointer to the created ExchangeContext object, owned by the session.
     */
    ExchangeContext * NewExchange(ExchangeDelegate * delegate, Protocols::Id protocol);
    ExchangeContext * NewExchange(ExchangeDelegate * delegate, std::vector<Protocols::Id> protocols);

    /**
     *  Register an unsolicited message handler for a given protocol identifier. This handler would be
     *  invoked when a message of @p protocolId opens a new exchange.
     *
     *  Registering a second handler for the same protocol replaces the first.
     */
    TETHER_ERROR RegisterUnsolicitedMessageHandlerForProtocol(Protocols::Id protocolId, UnsolicitedMessageHandler * handler);

    /**
     *  @retval #TETHER_ERROR_KEY_NOT_FOUND if no handler is registered for @p protocolId.
     */
    TETHER_ERROR UnregisterUnsolicitedMessageHandlerForProtocol(Protocols::Id protocolId);

    /**
     *  Entry point for inbound messages. Checks the message counter for
     *  duplicates, finds or creates the target exchange and delivers the
     *  message to its delegate unless the exchange drops it.
     */
    void OnMessageReceived(Message && message);

    /**
     *  Periodic tick: retransmits expired reliable messages, flushes
     *  expired acknowledgements and sends queued payloads on every live
     *  exchange.
     */
    void ServiceTimers();

    /// Hands @p message to the transport.
    TETHER_ERROR SendMessage(const Message & message);

    TETHER_ERROR AllocateMessageCounter(uint32_t & counter);

    /**
     *  Removes an exchange from its registry. The exchange object stays alive
     *  until the current OnMessageReceived() or ServiceTimers() call returns.
     */
    void Deregister(uint16_t exchangeId, bool initiator);

    ExchangeContext * FindExchange(uint16_t exchangeId, bool initiator) const;

    size_t GetNumActiveExchanges() const { return mInitiatorExchanges.size() + mResponderExchanges.size(); }
    size_t GetNumInitiatorExchanges() const { return mInitiatorExchanges.size(); }
    size_t GetNumResponderExchanges() const { return mResponderExchanges.size(); }

    uint16_t GetNextExchangeId() const { return mNextExchangeId; }

    /// Frees exchanges deregistered outside of OnMessageReceived() and ServiceTimers().
    void ReleaseClosedExchanges() { mReleasedExchanges.clear(); }

    void SetRemoteMRPConfig(const ReliableMessageProtocolConfig & config) { mRemoteMRPConfig = config; }
    const ReliableMessageProtocolConfig & GetRemoteMRPConfig() const { return mRemoteMRPConfig; }

    /**
     *  Base retransmission interval for messages to the peer: its active
     *  interval while it is active, its idle interval otherwise.
     */
    System::Clock::Timeout GetMRPBaseTimeout() const;

    /// True if the peer was heard from within its active threshold.
    bool IsPeerActive() const;

    MessageCounter & GetLocalMessageCounter() { return mLocalMessageCounter; }
    PeerMessageCounter & GetPeerMessageCounter() { return mPeerMessageCounter; }

    NodeId GetLocalNodeId() const { return mLocalNodeId; }
    NodeId GetPeerNodeId() const { return mPeerNodeId; }

private:
    using ExchangeMap = std::map<uint16_t, std::unique_ptr<ExchangeContext>>;

    struct UnsolicitedMessageHandlerSlot
    {
        UnsolicitedMessageHandlerSlot(Protocols::Id aProtocolId, UnsolicitedMessageHandler * aHandler) :
            protocolId(aProtocolId), handler(aHandler)
        {}

        Protocols::Id protocolId;
        UnsolicitedMessageHandler * handler;
    };

    ExchangeMap & Registry(bool initiator) { return initiator ? mInitiatorExchanges : mResponderExchanges; }
    const ExchangeMap & Registry(bool initiator) const { return initiator ? mInitiatorExchanges : mResponderExchanges; }

    ExchangeContext * CreateExchange(uint16_t exchangeId, bool initiator, ExchangeDelegate * delegate,
                                     std::vector<Protocols::Id> protocols);

    UnsolicitedMessageHandler * FindUnsolicitedMessageHandler(Protocols::Id protocolId) const;

    // Acks a reliable message addressed to no live exchange.
    void SendEphemeralAck(const Message & message);

    Transport::Base & mTransport;
    const NodeId mLocalNodeId;
    const NodeId mPeerNodeId;

    uint16_t mNextExchangeId;
    MessageCounter mLocalMessageCounter;
    PeerMessageCounter mPeerMessageCounter;

    ReliableMessageProtocolConfig mRemoteMRPConfig;
    Optional<System::Clock::Timestamp> mLastPeerActivityTime;

    ExchangeMap mInitiatorExchanges;
    ExchangeMap mResponderExchanges;
    std::vector<std::unique_ptr<ExchangeContext>> mReleasedExchanges;

    std::vector<UnsolicitedMessageHandlerSlot> mUnsolicitedMessageHandlers;
};

} // namespace Messaging
} // namespace tether
