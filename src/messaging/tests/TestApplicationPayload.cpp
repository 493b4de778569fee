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

#include <lib/core/TetherError.h>
#include <messaging/ApplicationPayload.h>
#include <protocols/echo/Echo.h>

#include <gtest/gtest.h>

#include <utility>
#include <vector>

namespace {

using namespace tether;
using namespace tether::Messaging;

TEST(TestApplicationPayload, TestPlainPayload)
{
    PlainPayload payload(Protocols::Echo::MsgType::EchoRequest, std::vector<uint8_t>{ 1, 2, 3 });
    EXPECT_TRUE(payload.GetProtocolId() == Protocols::Echo::Id);
    EXPECT_EQ(payload.GetMessageType(), 0x01);
    EXPECT_FALSE(payload.IsChunked());
    EXPECT_FALSE(payload.HasMoreChunks());

    uint8_t buffer[8];
    MutableByteSpan span(buffer);
    EXPECT_EQ(payload.EncodeInto(span), TETHER_NO_ERROR);
    EXPECT_EQ(span.size(), 3u);
    EXPECT_TRUE(buffer[0] == 1 && buffer[1] == 2 && buffer[2] == 3);
}

TEST(TestApplicationPayload, TestPlainPayloadTooLong)
{
    PlainPayload payload(Protocols::Echo::Id, 0x02, std::vector<uint8_t>(9, 0xAA));
    EXPECT_EQ(payload.GetMessageType(), 0x02);

    uint8_t buffer[8];
    MutableByteSpan span(buffer);
    EXPECT_EQ(payload.EncodeInto(span), TETHER_ERROR_MESSAGE_TOO_LONG);
    EXPECT_EQ(span.size(), sizeof(buffer));
}

TEST(TestApplicationPayload, TestByteChunkedPayload)
{
    std::vector<uint8_t> data(10);
    for (size_t i = 0; i < data.size(); i++)
    {
        data[i] = static_cast<uint8_t>(i);
    }

    ByteChunkedPayload payload(Protocols::Echo::MsgType::EchoRequest, std::move(data));
    EXPECT_TRUE(payload.IsChunked());
    EXPECT_TRUE(payload.HasMoreChunks());

    uint8_t buffer[4];

    MutableByteSpan first(buffer);
    EXPECT_EQ(payload.EncodeInto(first), TETHER_NO_ERROR);
    EXPECT_EQ(first.size(), 4u);
    EXPECT_EQ(buffer[0], 0);
    EXPECT_EQ(buffer[3], 3);
    EXPECT_TRUE(payload.HasMoreChunks());
    EXPECT_EQ(payload.GetEncodedLength(), 4u);

    MutableByteSpan second(buffer);
    EXPECT_EQ(payload.EncodeInto(second), TETHER_NO_ERROR);
    EXPECT_EQ(second.size(), 4u);
    EXPECT_EQ(buffer[0], 4);
    EXPECT_TRUE(payload.HasMoreChunks());

    MutableByteSpan last(buffer);
    EXPECT_EQ(payload.EncodeInto(last), TETHER_NO_ERROR);
    EXPECT_EQ(last.size(), 2u);
    EXPECT_EQ(buffer[0], 8);
    EXPECT_EQ(buffer[1], 9);
    EXPECT_FALSE(payload.HasMoreChunks());
    EXPECT_EQ(payload.GetEncodedLength(), 10u);

    // Nothing left: encodes to nothing.
    MutableByteSpan after(buffer);
    EXPECT_EQ(payload.EncodeInto(after), TETHER_NO_ERROR);
    EXPECT_TRUE(after.empty());
}

TEST(TestApplicationPayload, TestByteChunkedPayloadEmptyBuffer)
{
    ByteChunkedPayload payload(Protocols::Echo::Id, 0x01, std::vector<uint8_t>(3, 0x55));

    MutableByteSpan empty;
    EXPECT_EQ(payload.EncodeInto(empty), TETHER_ERROR_BUFFER_TOO_SMALL);
    EXPECT_TRUE(payload.HasMoreChunks());
    EXPECT_EQ(payload.GetEncodedLength(), 0u);
}

} // namespace
