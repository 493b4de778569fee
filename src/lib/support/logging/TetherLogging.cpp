/*
 *
 *    Copyright (c) 2020-2021 Project CHIP Authors
 *    Copyright (c) 2013-2017 Nest Labs, Inc.
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
 *      This file implements macros, constants, and interfaces for a
 *      platform-independent logging interface for the Tether SDK, with
 *      a standard I/O sink for Linux hosts.
 */

#include <lib/support/logging/TetherLogging.h>

#include <atomic>
#include <inttypes.h>
#include <stdio.h>
#include <sys/time.h>
#include <unistd.h>

namespace tether {
namespace Logging {

namespace {

// clang-format off
const char * const sModuleNames[kLogModule_Max] = {
    "-",   // NotSpecified
    "SPT", // Support
    "CR",  // Crypto
    "TP",  // Transport
    "SC",  // SecureChannel
    "EM",  // ExchangeManager
    "TST", // Test
};
// clang-format on

std::atomic<LogRedirectCallback_t> sLogRedirectCallback{ nullptr };
std::atomic<uint8_t> sLogFilter{ kLogCategory_Max };

void DefaultLogSink(const char * module, uint8_t category, const char * msg, va_list args)
{
    struct timeval tv;
    gettimeofday(&tv, nullptr);

    // Lock standard output, so a single log line will not be corrupted in
    // case where multiple threads are using logging subsystem at the same time.
    flockfile(stdout);

    printf("[%" PRIu64 ".%06" PRIu64 "][%lld] TTH:%s: ", static_cast<uint64_t>(tv.tv_sec), static_cast<uint64_t>(tv.tv_usec),
           static_cast<long long>(getpid()), module);
    if (category == kLogCategory_Error)
    {
        printf("error: ");
    }
    vprintf(msg, args);
    printf("\n");
    fflush(stdout);

    funlockfile(stdout);
}

} // namespace

void SetLogRedirectCallback(LogRedirectCallback_t callback)
{
    sLogRedirectCallback.store(callback);
}

void SetLogFilter(uint8_t category)
{
    sLogFilter.store(category);
}

uint8_t GetLogFilter()
{
    return sLogFilter.load();
}

bool IsCategoryEnabled(uint8_t category)
{
    return category != kLogCategory_None && category <= GetLogFilter();
}

const char * GetModuleName(LogModule module)
{
    return sModuleNames[(module < kLogModule_Max) ? module : kLogModule_NotSpecified];
}

void Log(uint8_t module, uint8_t category, const char * msg, ...)
{
    va_list v;
    va_start(v, msg);
    LogV(module, category, msg, v);
    va_end(v);
}

void LogV(uint8_t module, uint8_t category, const char * msg, va_list args)
{
    if (!IsCategoryEnabled(category))
    {
        return;
    }

    const char * moduleName = GetModuleName(static_cast<LogModule>(module));
    LogRedirectCallback_t redirect = sLogRedirectCallback.load();
    if (redirect != nullptr)
    {
        redirect(moduleName, category, msg, args);
    }
    else
    {
        DefaultLogSink(moduleName, category, msg, args);
    }
}

} // namespace Logging
} // namespace tether
