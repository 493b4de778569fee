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

#include <crypto/RandUtils.h>

#include <gtest/gtest.h>

#include <set>
#include <string.h>

namespace {

using namespace tether;
using namespace tether::Crypto;

TEST(TestRandUtils, TestDRBGGetBytes)
{
    uint8_t buffer[32];
    memset(buffer, 0, sizeof(buffer));

    EXPECT_EQ(DRBG_get_bytes(buffer, sizeof(buffer)), TETHER_NO_ERROR);

    // 32 zero bytes out of a working DRBG would be a 1 in 2^256 event.
    uint8_t zeros[32] = { 0 };
    EXPECT_NE(memcmp(buffer, zeros, sizeof(buffer)), 0);
}

TEST(TestRandUtils, TestDRBGInvalidArguments)
{
    uint8_t buffer[4];
    EXPECT_EQ(DRBG_get_bytes(nullptr, sizeof(buffer)), TETHER_ERROR_INVALID_ARGUMENT);
    EXPECT_EQ(DRBG_get_bytes(buffer, 0), TETHER_ERROR_INVALID_ARGUMENT);
}

TEST(TestRandUtils, TestRandomValuesVary)
{
    std::set<uint32_t> seen32;
    std::set<uint64_t> seen64;
    std::set<uint16_t> seen16;
    std::set<uint8_t> seen8;

    for (int i = 0; i < 64; i++)
    {
        seen32.insert(GetRandU32());
        seen64.insert(GetRandU64());
        seen16.insert(GetRandU16());
        seen8.insert(GetRandU8());
    }

    EXPECT_GT(seen32.size(), 60u);
    EXPECT_GT(seen64.size(), 60u);
    EXPECT_GT(seen16.size(), 32u);
    EXPECT_GT(seen8.size(), 8u);
}

} // namespace
