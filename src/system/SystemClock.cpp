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

#include <system/SystemClock.h>

#include <lib/support/CodeUtils.h>

#include <errno.h>
#include <time.h>

namespace tether {
namespace System {
namespace Clock {

namespace Internal {

ClockImpl gClockImpl;
ClockBase * gClockBase = &gClockImpl;

} // namespace Internal

Microseconds64 ClockImpl::GetMonotonicMicroseconds64()
{
    struct timespec ts;
    int result = clock_gettime(CLOCK_MONOTONIC, &ts);
    VerifyOrDie(result == 0);
    return Seconds64(ts.tv_sec) +
        std::chrono::duration_cast<Microseconds64>(std::chrono::duration<uint64_t, std::nano>(ts.tv_nsec));
}

Milliseconds64 ClockImpl::GetMonotonicMilliseconds64()
{
    return std::chrono::duration_cast<Milliseconds64>(GetMonotonicMicroseconds64());
}

} // namespace Clock
} // namespace System
} // namespace tether
