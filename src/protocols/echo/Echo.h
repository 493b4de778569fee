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
 *    @file
 *      Message types of the Echo protocol, a request/response pair used to
 *      exercise exchanges end to end.
 */

#pragma once

#include <protocols/Protocols.h>

#include <stdint.h>

namespace tether {
namespace Protocols {
namespace Echo {

/**
 * Echo Protocol Message Types
 */
enum class MsgType : uint8_t
{
    EchoRequest  = 0x01,
    EchoResponse = 0x02
};

} // namespace Echo

template <>
struct MessageTypeTraits<Echo::MsgType>
{
    static constexpr const Protocols::Id & ProtocolId() { return Echo::Id; }
};

} // namespace Protocols
} // namespace tether
