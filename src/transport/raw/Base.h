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

/**
 * @file
 *   Defines base properties and constants valid across all transport
 *   classes (UDP, TCP, BLE, ....)
 */

#pragma once

#include <lib/core/TetherError.h>
#include <transport/raw/MessageHeader.h>

namespace tether {
namespace Transport {

/**
 * Transport class base, defining common methods among transports (message
 * packing/encoding and send/receive).
 *
 * Encryption, framing and addressing of the peer belong to the concrete
 * transport. Delivery of inbound messages goes through
 * Messaging::Session::OnMessageReceived.
 */
class Base
{
public:
    virtual ~Base() {}

    /**
     * @brief Send a message to the peer of the session bound to this transport.
     *
     * Called once per transmission attempt; a retransmission passes the very
     * same message again.
     */
    virtual TETHER_ERROR SendMessage(const Message & message) = 0;
};

} // namespace Transport
} // namespace tether
