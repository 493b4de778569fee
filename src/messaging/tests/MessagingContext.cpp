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

#include <messaging/tests/MessagingContext.h>

#include <lib/support/CodeUtils.h>
#include <protocols/secure_channel/Constants.h>

#include <utility>

namespace tether {
namespace Test {

using namespace System::Clock::Literals;

TETHER_ERROR LoopbackTransport::Enqueue(const Message & message, Messaging::Session * receiver)
{
    ReturnErrorOnFailure(mMessageSendError);
    VerifyOrReturnError(receiver != nullptr, TETHER_ERROR_NOT_CONNECTED);

    mSentMessageCount++;
    mSentMessages.push_back(message);

    if (mNumMessagesToDrop != 0)
    {
        mNumMessagesToDrop--;
        mDroppedMessageCount++;
        return TETHER_NO_ERROR;
    }

    mPendingMessages.push_back(PendingMessage{ message, receiver });
    return TETHER_NO_ERROR;
}

void LoopbackTransport::DrainPendingMessages()
{
    while (!mPendingMessages.empty())
    {
        PendingMessage pending = std::move(mPendingMessages.front());
        mPendingMessages.pop_front();
        pending.receiver->OnMessageReceived(std::move(pending.message));
    }
}

void LoopbackTransport::Reset()
{
    mPendingMessages.clear();
    mSentMessages.clear();
    mSentMessageCount    = 0;
    mNumMessagesToDrop   = 0;
    mDroppedMessageCount = 0;
    mMessageSendError    = TETHER_NO_ERROR;
}

size_t LoopbackTransport::CountSentMessages(Protocols::Id protocolId, uint8_t msgType) const
{
    size_t count = 0;
    for (const auto & message : mSentMessages)
    {
        if (message.HasMessageType(protocolId, msgType))
        {
            count++;
        }
    }
    return count;
}

size_t LoopbackTransport::CountSentStandaloneAcks() const
{
    return CountSentMessages(Protocols::SecureChannel::Id, to_underlying(Protocols::SecureChannel::MsgType::StandaloneAck));
}

TETHER_ERROR LoopbackMessagingContext::Init()
{
    mRealClock = &System::SystemClock();
    System::Clock::Internal::SetSystemClockForTesting(&mMockClock);
    mMockClock.SetMonotonic(0_ms64);

    ResetSessions();
    return TETHER_NO_ERROR;
}

void LoopbackMessagingContext::Shutdown()
{
    mLoopback.Reset();
    mAliceEndpoint.SetReceiver(nullptr);
    mBobEndpoint.SetReceiver(nullptr);
    mAliceSession.reset();
    mBobSession.reset();

    if (mRealClock != nullptr)
    {
        System::Clock::Internal::SetSystemClockForTesting(mRealClock);
        mRealClock = nullptr;
    }
}

void LoopbackMessagingContext::ResetSessions()
{
    mLoopback.Reset();
    mAliceSession.reset();
    mBobSession.reset();

    mAliceSession = std::make_unique<Messaging::Session>(mAliceEndpoint, kAliceNodeId, kBobNodeId);
    mBobSession   = std::make_unique<Messaging::Session>(mBobEndpoint, kBobNodeId, kAliceNodeId);
    mAliceEndpoint.SetReceiver(mBobSession.get());
    mBobEndpoint.SetReceiver(mAliceSession.get());
}

Messaging::ExchangeContext * LoopbackMessagingContext::NewExchangeToAlice(Messaging::ExchangeDelegate * delegate,
                                                                          Protocols::Id protocol)
{
    return mBobSession->NewExchange(delegate, protocol);
}

Messaging::ExchangeContext * LoopbackMessagingContext::NewExchangeToBob(Messaging::ExchangeDelegate * delegate,
                                                                        Protocols::Id protocol)
{
    return mAliceSession->NewExchange(delegate, protocol);
}

void LoopbackMessagingContext::DrainAndServiceIO()
{
    do
    {
        mLoopback.DrainPendingMessages();
        mAliceSession->ServiceTimers();
        mBobSession->ServiceTimers();
    } while (mLoopback.HasPendingMessages());
}

void LoopbackMessagingContext::AdvanceClockAndServiceIO(System::Clock::Milliseconds64 delta)
{
    mMockClock.AdvanceMonotonic(delta);
    DrainAndServiceIO();
}

} // namespace Test
} // namespace tether
