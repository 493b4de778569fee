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

#include <system/SystemClock.h>

#include <gtest/gtest.h>

namespace {

using namespace tether::System;
using namespace tether::System::Clock::Literals;

class TestSystemClock : public ::testing::Test
{
protected:
    void SetUp() override
    {
        mRealClock = &SystemClock();
        Clock::Internal::SetSystemClockForTesting(&mMockClock);
    }

    void TearDown() override { Clock::Internal::SetSystemClockForTesting(mRealClock); }

    Clock::Internal::MockClock mMockClock;
    Clock::ClockBase * mRealClock = nullptr;
};

TEST_F(TestSystemClock, CheckMockClockInstalled)
{
    EXPECT_TRUE(&SystemClock() == &mMockClock);
    EXPECT_TRUE(SystemClock().GetMonotonicTimestamp() == Clock::kZero);

    mMockClock.SetMonotonic(5000_ms64);
    EXPECT_TRUE(SystemClock().GetMonotonicTimestamp() == 5000_ms64);
    EXPECT_TRUE(SystemClock().GetMonotonicMicroseconds64() == Clock::Microseconds64(5000000));
}

TEST_F(TestSystemClock, CheckAdvanceMonotonic)
{
    mMockClock.SetMonotonic(1000_ms64);

    // Deadlines are computed as a timestamp plus a 32-bit timeout.
    Clock::Timeout ackTimeout = 200_ms32;
    Clock::Timestamp deadline = SystemClock().GetMonotonicTimestamp() + ackTimeout;
    EXPECT_TRUE(deadline == 1200_ms64);

    mMockClock.AdvanceMonotonic(199_ms64);
    EXPECT_TRUE(SystemClock().GetMonotonicTimestamp() < deadline);

    mMockClock.AdvanceMonotonic(1_ms64);
    EXPECT_TRUE(SystemClock().GetMonotonicTimestamp() >= deadline);

    mMockClock.AdvanceMonotonic(Clock::Milliseconds64(0));
    EXPECT_TRUE(SystemClock().GetMonotonicTimestamp() == 1200_ms64);
}

TEST_F(TestSystemClock, CheckRestoreRealClock)
{
    mMockClock.SetMonotonic(42_ms64);
    Clock::Internal::SetSystemClockForTesting(mRealClock);

    // The real clock keeps its own time and never goes backwards.
    Clock::Timestamp first  = SystemClock().GetMonotonicTimestamp();
    Clock::Timestamp second = SystemClock().GetMonotonicTimestamp();
    EXPECT_TRUE(second >= first);
    EXPECT_TRUE(&SystemClock() != &mMockClock);

    Clock::Internal::SetSystemClockForTesting(&mMockClock);
    EXPECT_TRUE(SystemClock().GetMonotonicTimestamp() == 42_ms64);
}

} // namespace
