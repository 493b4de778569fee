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
#include <lib/support/CodeUtils.h>

#include <gtest/gtest.h>

#include <inttypes.h>
#include <stdio.h>
#include <string.h>

namespace {

using namespace tether;

// clang-format off
static const TETHER_ERROR kTestElements[] =
{
    TETHER_ERROR_INCORRECT_STATE,
    TETHER_ERROR_NOT_CONNECTED,
    TETHER_ERROR_NO_MEMORY,
    TETHER_ERROR_MESSAGE_TOO_LONG,
    TETHER_ERROR_BUFFER_TOO_SMALL,
    TETHER_ERROR_INVALID_MESSAGE_TYPE,
    TETHER_ERROR_INVALID_ARGUMENT,
    TETHER_ERROR_INVALID_ACK_MESSAGE_COUNTER,
    TETHER_ERROR_MESSAGE_NOT_ACKNOWLEDGED,
    TETHER_ERROR_DUPLICATE_MESSAGE_RECEIVED,
    TETHER_ERROR_MESSAGE_COUNTER_EXHAUSTED,
    TETHER_ERROR_KEY_NOT_FOUND,
    TETHER_ERROR_DRBG_FAILURE,
    TETHER_ERROR_INTERNAL,
};
// clang-format on

TETHER_ERROR FailWith(TETHER_ERROR err)
{
    ReturnErrorOnFailure(err);
    return TETHER_ERROR_INTERNAL;
}

TETHER_ERROR CheckArgument(int value)
{
    VerifyOrReturnError(value > 0, TETHER_ERROR_INVALID_ARGUMENT);
    return TETHER_NO_ERROR;
}

TEST(TestTetherError, CheckSuccess)
{
    EXPECT_TRUE(TETHER_NO_ERROR.IsSuccess());
    EXPECT_TRUE(TETHER_ERROR() == TETHER_NO_ERROR);

    for (const auto & err : kTestElements)
    {
        EXPECT_FALSE(err.IsSuccess());
        EXPECT_TRUE(err != TETHER_NO_ERROR);
    }
}

TEST(TestTetherError, CheckErrorStr)
{
    for (const auto & err : kTestElements)
    {
        const char * str = ErrorStr(err);
        ASSERT_TRUE(str != nullptr);

        // Every known error carries its code and a description.
        char code[16];
        snprintf(code, sizeof(code), "0x%08" PRIX32, err.AsInteger());
        EXPECT_TRUE(strstr(str, code) != nullptr);
        EXPECT_TRUE(strchr(str, ':') != nullptr);
    }

    EXPECT_STREQ(TETHER_ERROR_MESSAGE_NOT_ACKNOWLEDGED.Format(), "Error 0x00000042: Message not acknowledged after max retries");
    EXPECT_STREQ(TETHER_CORE_ERROR(0x1234).AsString(), "Error 0x00001234");
}

TEST(TestTetherError, CheckCodeUtils)
{
    EXPECT_EQ(FailWith(TETHER_ERROR_NO_MEMORY), TETHER_ERROR_NO_MEMORY);
    EXPECT_EQ(FailWith(TETHER_NO_ERROR), TETHER_ERROR_INTERNAL);

    EXPECT_EQ(CheckArgument(0), TETHER_ERROR_INVALID_ARGUMENT);
    EXPECT_EQ(CheckArgument(1), TETHER_NO_ERROR);
}

} // namespace
