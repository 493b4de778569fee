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

#include <lib/support/BitFlags.h>

#include <gtest/gtest.h>

#include <stdint.h>

namespace {

using namespace tether;

enum class TestEnum : uint16_t
{
    kZero = 0x0000,
    kOne  = 0x0001,
    kTwo  = 0x0002,
    kFour = 0x0004,
};

TEST(TestBitFlags, TestBitFlags)
{
    BitFlags<TestEnum> flags;

    EXPECT_FALSE(flags.HasAny());
    EXPECT_TRUE(flags.Has(TestEnum::kZero));
    EXPECT_FALSE(flags.Has(TestEnum::kOne));

    flags.Set(TestEnum::kOne);
    EXPECT_TRUE(flags.HasAny());
    EXPECT_TRUE(flags.Has(TestEnum::kOne));
    EXPECT_FALSE(flags.Has(TestEnum::kTwo));
    EXPECT_TRUE(flags.Raw() == 0x0001);

    flags.Set(TestEnum::kFour, true);
    EXPECT_TRUE(flags.Raw() == 0x0005);
    EXPECT_TRUE(flags.HasOnly(TestEnum::kOne, TestEnum::kFour));
    EXPECT_FALSE(flags.HasOnly(TestEnum::kOne));

    flags.Set(TestEnum::kOne, false);
    EXPECT_FALSE(flags.Has(TestEnum::kOne));
    EXPECT_TRUE(flags.Has(TestEnum::kFour));

    flags.Clear(TestEnum::kFour);
    EXPECT_FALSE(flags.HasAny());
}

TEST(TestBitFlags, TestConstruction)
{
    BitFlags<TestEnum> a(TestEnum::kOne, TestEnum::kTwo);
    EXPECT_TRUE(a.Raw() == 0x0003);

    BitFlags<TestEnum> b(static_cast<uint16_t>(0x0003));
    EXPECT_TRUE(a == b);

    BitFlags<TestEnum> c(TestEnum::kFour);
    EXPECT_TRUE(a != c);
    EXPECT_TRUE(c.Get() == TestEnum::kFour);

    c.Set(a);
    EXPECT_TRUE(c.Raw() == 0x0007);

    c.SetRaw(0x0002);
    EXPECT_TRUE(c.Has(TestEnum::kTwo));
    EXPECT_FALSE(c.Has(TestEnum::kOne));

    c.ClearAll();
    EXPECT_FALSE(c.HasAny());
}

} // namespace
