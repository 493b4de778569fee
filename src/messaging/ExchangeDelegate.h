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
 *      This file defines the classes corresponding to Tether Exchange management Delegate.
 *
 */

#pragma once

#include <lib/core/TetherError.h>
#include <transport/raw/MessageHeader.h>

namespace tether {
namespace Messaging {

class ExchangeContext;

/**
 *  @class ExchangeDelegate
 *
 *  @brief
 *    This class provides a skeleton for the callback functions. The functions will be
 *    called by ExchangeContext object on specific events. If the user of ExchangeContext
 *    is interested to receive these callbacks, they can specialize this class and handle
 *    each trigger in their implementation of this class.
 *
 *    For consistent handling of exchange lifetime, the delegate must not
 *    close or destroy the exchange from OnExchangeClosing.
 */
class ExchangeDelegate
{
public:
    virtual ~ExchangeDelegate() {}

    /**
     * @brief
     *   This function is the protocol callback for handling a received message.
     *
     *   The exchange is still open when this is called; the delegate may send
     *   a response on it or close it.
     *
     *  @param[in]    ec            A pointer to the ExchangeContext object.
     *  @param[in]    message       A reference to the received message, payload included.
     *
     *  @retval  #TETHER_ERROR_INVALID_ARGUMENT if an invalid argument was passed to this function.
     *  @retval  #TETHER_NO_ERROR on success.
     */
    virtual TETHER_ERROR OnMessageReceived(ExchangeContext * ec, const Message & message) = 0;

    /**
     * @brief
     *   Called when the last reliable message sent on @p ec was retransmitted
     *   the maximum number of times without being acknowledged. The exchange
     *   is closed right after this returns.
     */
    virtual void OnDeliveryFailure(ExchangeContext * ec, TETHER_ERROR error) {}

    /**
     * @brief
     *   Called once, when the exchange is being removed from its session.
     */
    virtual void OnExchangeClosing(ExchangeContext * ec) {}
};

/**
 * @brief
 *   An object that receives messages for unknown exchanges of a given
 *   protocol, and decides which delegate handles the new exchange.
 */
class UnsolicitedMessageHandler
{
public:
    virtual ~UnsolicitedMessageHandler() {}

    /**
     * @brief
     *   Called when a message that opens a new exchange arrives. On success
     *   @p newDelegate must be set to the delegate of the new exchange.
     *
     *   Returning an error causes the message to be dropped. A reliable
     *   message is still acknowledged.
     *
     *  @param[in]    message       The unsolicited message.
     *  @param[out]   newDelegate   Delegate for the responder exchange.
     */
    virtual TETHER_ERROR OnUnsolicitedMessageReceived(const Message & message, ExchangeDelegate *& newDelegate) = 0;
};

} // namespace Messaging
} // namespace tether
