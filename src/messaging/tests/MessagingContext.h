/*
 *
 *    Copyright (c) 2020 Project CHIP Authors
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
#pragma once

#include <lib/core/TetherError.h>
#include <messaging/ExchangeContext.h>
#include <messaging/ExchangeDelegate.h>
#include <messaging/Session.h>
#include <protocols/Protocols.h>
#include <system/SystemClock.h>
#include <transport/raw/Base.h>
#include <transport/raw/MessageHeader.h>

#include <deque>
#include <memory>
#include <vector>

namespace tether {
namespace Test {

/**
 * An in-memory transport between two sessions. Sent messages are queued and
 * only delivered when the test drains the queue, so nothing is delivered
 * from inside a send call.
 */
class LoopbackTransport
{
public:
    // One direction of the loopback: sends from one session to the other.
    class Endpoint : public Transport::Base
    {
    public:
        Endpoint(LoopbackTransport & loopback) : mLoopback(loopback) {}

        void SetReceiver(Messaging::Session * receiver) { mReceiver = receiver; }

        TETHER_ERROR SendMessage(const Message & message) override { return mLoopback.Enqueue(message, mReceiver); }

    private:
        LoopbackTransport & mLoopback;
        Messaging::Session * mReceiver = nullptr;
    };

    /// Delivers queued messages until the queue is empty.
    void DrainPendingMessages();

    bool HasPendingMessages() const { return !mPendingMessages.empty(); }

    void Reset();

    /// Number of sent messages matching protocol @p protocolId and type @p msgType.
    size_t CountSentMessages(Protocols::Id protocolId, uint8_t msgType) const;

    size_t CountSentStandaloneAcks() const;

    // Every message handed to the transport, dropped ones included.
    std::vector<Message> mSentMessages;
    uint32_t mSentMessageCount    = 0;
    uint32_t mNumMessagesToDrop   = 0;
    uint32_t mDroppedMessageCount = 0;

    // Returned by the next sends instead of sending, when not TETHER_NO_ERROR.
    TETHER_ERROR mMessageSendError = TETHER_NO_ERROR;

private:
    struct PendingMessage
    {
        Message message;
        Messaging::Session * receiver;
    };

    TETHER_ERROR Enqueue(const Message & message, Messaging::Session * receiver);

    std::deque<PendingMessage> mPendingMessages;
};

/**
 * @brief
 *   Two nodes, Alice and Bob, each with a session to the other, connected by
 *   a LoopbackTransport and driven by a mock clock.
 */
class LoopbackMessagingContext
{
public:
    static constexpr NodeId kAliceNodeId = 111222333;
    static constexpr NodeId kBobNodeId   = 123654;

    LoopbackMessagingContext() : mAliceEndpoint(mLoopback), mBobEndpoint(mLoopback) {}

    /// Installs the mock clock and creates both sessions.
    TETHER_ERROR Init();

    /// Destroys both sessions and restores the real clock.
    void Shutdown();

    /// Recreates both sessions and clears the loopback state.
    void ResetSessions();

    Messaging::Session & GetSessionAliceToBob() { return *mAliceSession; }
    Messaging::Session & GetSessionBobToAlice() { return *mBobSession; }

    LoopbackTransport & GetLoopback() { return mLoopback; }
    System::Clock::Internal::MockClock & GetMockClock() { return mMockClock; }

    Messaging::ExchangeContext * NewExchangeToAlice(Messaging::ExchangeDelegate * delegate,
                                                    Protocols::Id protocol = Protocols::Echo::Id);
    Messaging::ExchangeContext * NewExchangeToBob(Messaging::ExchangeDelegate * delegate,
                                                  Protocols::Id protocol = Protocols::Echo::Id);

    /**
     * Delivers every queued message and services the timers of both sessions,
     * repeatedly, until no message is left in flight. The clock does not move.
     */
    void DrainAndServiceIO();

    /// Moves the mock clock forward by @p delta, then calls DrainAndServiceIO().
    void AdvanceClockAndServiceIO(System::Clock::Milliseconds64 delta);

    System::Clock::Timestamp GetNow() { return mMockClock.GetMonotonicTimestamp(); }

private:
    LoopbackTransport mLoopback;
    LoopbackTransport::Endpoint mAliceEndpoint;
    LoopbackTransport::Endpoint mBobEndpoint;

    std::unique_ptr<Messaging::Session> mAliceSession;
    std::unique_ptr<Messaging::Session> mBobSession;

    System::Clock::Internal::MockClock mMockClock;
    System::Clock::ClockBase * mRealClock = nullptr;
};

} // namespace Test
} // namespace tether
