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
 *      Unit tests for the byte spans that carry message payloads.
 */

#include <lib/core/TetherError.h>
#include <lib/support/Span.h>

#include <gtest/gtest.h>

#include <stdint.h>

namespace {

using namespace tether;

TEST(TestSpan, TestEmptySpans)
{
    ByteSpan bytes;
    EXPECT_TRUE(bytes.empty());
    EXPECT_EQ(bytes.size(), 0u);
    EXPECT_TRUE(bytes.begin() == bytes.end());

    // Two empty spans compare equal whatever they point at.
    const uint8_t storage[1] = { 7 };
    EXPECT_TRUE(bytes.data_equal(ByteSpan(storage, 0)));
    EXPECT_FALSE(bytes.data_equal(ByteSpan(storage)));
}

TEST(TestSpan, TestViewOverBuffer)
{
    uint8_t frame[] = { 0x10, 0x20, 0x30, 0x40, 0x50 };
    MutableByteSpan writable(frame);
    EXPECT_EQ(writable.size(), sizeof(frame));
    EXPECT_TRUE(writable.data() == frame);

    // A span does not own its bytes: writes go straight to the buffer.
    *writable.begin() = 0x11;
    EXPECT_EQ(frame[0], 0x11);

    ByteSpan readable = writable;
    EXPECT_TRUE(readable.data() == frame);
    EXPECT_TRUE(readable.data_equal(writable));

    size_t sum = 0;
    for (uint8_t byte : readable)
    {
        sum += byte;
    }
    EXPECT_EQ(sum, 0x11u + 0x20u + 0x30u + 0x40u + 0x50u);
}

TEST(TestSpan, TestReduceSize)
{
    uint8_t frame[16] = { 0 };
    MutableByteSpan writable(frame);

    writable.reduce_size(6);
    EXPECT_EQ(writable.size(), 6u);
    EXPECT_TRUE(writable.end() == frame + 6);

    writable.reduce_size(6);
    EXPECT_EQ(writable.size(), 6u);

    writable.reduce_size(0);
    EXPECT_TRUE(writable.empty());
    EXPECT_TRUE(writable.data() == frame);
}

TEST(TestSpan, TestDataEqual)
{
    const uint8_t hello[] = { 'h', 'e', 'l', 'l', 'o' };
    const uint8_t help[]  = { 'h', 'e', 'l', 'p' };
    uint8_t helloCopy[]   = { 'h', 'e', 'l', 'l', 'o' };

    EXPECT_TRUE(ByteSpan(hello).data_equal(MutableByteSpan(helloCopy)));
    EXPECT_FALSE(ByteSpan(hello).data_equal(ByteSpan(help)));
    EXPECT_TRUE(ByteSpan(hello, 3).data_equal(ByteSpan(help, 3)));

    helloCopy[4] = '!';
    EXPECT_FALSE(ByteSpan(hello).data_equal(MutableByteSpan(helloCopy)));
}

TEST(TestSpan, TestCopySpanToMutableSpan)
{
    const uint8_t payload[] = { 1, 2, 3, 4 };

    uint8_t roomy[8] = { 0 };
    MutableByteSpan destination(roomy);
    EXPECT_EQ(CopySpanToMutableSpan(ByteSpan(payload), destination), TETHER_NO_ERROR);
    EXPECT_EQ(destination.size(), sizeof(payload));
    EXPECT_TRUE(destination.data_equal(ByteSpan(payload)));
    EXPECT_EQ(roomy[4], 0);

    // Exactly enough room.
    uint8_t exact[4] = { 0 };
    MutableByteSpan exactSpan(exact);
    EXPECT_EQ(CopySpanToMutableSpan(ByteSpan(payload), exactSpan), TETHER_NO_ERROR);
    EXPECT_TRUE(exactSpan.data_equal(ByteSpan(payload)));

    // Too small: the destination is left alone.
    uint8_t tight[3] = { 9, 9, 9 };
    MutableByteSpan tightSpan(tight);
    EXPECT_EQ(CopySpanToMutableSpan(ByteSpan(payload), tightSpan), TETHER_ERROR_BUFFER_TOO_SMALL);
    EXPECT_EQ(tightSpan.size(), sizeof(tight));
    EXPECT_EQ(tight[0], 9);

    // An empty source empties the destination.
    MutableByteSpan cleared(roomy);
    EXPECT_EQ(CopySpanToMutableSpan(ByteSpan(), cleared), TETHER_NO_ERROR);
    EXPECT_TRUE(cleared.empty());
}

} // namespace
