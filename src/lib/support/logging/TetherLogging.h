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
 *      This file defines macros, constants, and interfaces for a
 *      platform-independent logging interface for the Tether SDK.
 *
 *      Each category can be compiled out with the TETHER_*_LOGGING
 *      switches in TetherConfig.h and filtered at run time.
 *
 *      The Tether SDK log categories are:
 *
 *        - Error: Represents a serious failure that the caller should
 *          see and act upon.
 *        - Progress: Represents significant, normal state changes.
 *        - Detail: Represents a detailed trace, useful for debugging.
 *        - Automation: Represents machine readable output for test
 *          harnesses.
 */

#pragma once

#include <lib/core/TetherConfig.h>

#include <inttypes.h>
#include <stdarg.h>
#include <stdint.h>

#if defined(__GNUC__) || defined(__clang__)
#define TETHER_ENFORCE_FORMAT(fmtIndex, argIndex) __attribute__((format(printf, fmtIndex, argIndex)))
#else
#define TETHER_ENFORCE_FORMAT(fmtIndex, argIndex)
#endif

namespace tether {
namespace Logging {

/**
 *  @enum LogModule
 *
 *  @brief
 *    Identifies a logical section of code that is a source of log
 *    messages.
 */
enum LogModule
{
    kLogModule_NotSpecified = 0,

    kLogModule_Support,
    kLogModule_Crypto,
    kLogModule_Transport,
    kLogModule_SecureChannel,
    kLogModule_ExchangeManager,
    kLogModule_Test,

    kLogModule_Max
};

/**
 *  @enum LogCategory
 *
 *  @brief
 *    Identifies a category to which a particular error message
 *    belongs.
 */
enum LogCategory
{
    kLogCategory_None = 0,

    kLogCategory_Error      = 1,
    kLogCategory_Progress   = 2,
    kLogCategory_Detail     = 3,
    kLogCategory_Automation = 4,

    kLogCategory_Max = kLogCategory_Automation
};

/**
 * Signature of a log sink. @p module is the short module name, @p msg is the
 * unformatted printf-style message and @p args its arguments.
 */
using LogRedirectCallback_t = void (*)(const char * module, uint8_t category, const char * msg, va_list args);

/**
 * Routes every subsequent log line to @p callback. Passing nullptr restores
 * the default stdout sink.
 */
void SetLogRedirectCallback(LogRedirectCallback_t callback);

void SetLogFilter(uint8_t category);
uint8_t GetLogFilter();
bool IsCategoryEnabled(uint8_t category);

const char * GetModuleName(LogModule module);

void Log(uint8_t module, uint8_t category, const char * msg, ...) TETHER_ENFORCE_FORMAT(3, 4);
void LogV(uint8_t module, uint8_t category, const char * msg, va_list args) TETHER_ENFORCE_FORMAT(3, 0);

} // namespace Logging
} // namespace tether

#if TETHER_ERROR_LOGGING
/**
 * @def TetherLogError(MOD, MSG, ...)
 *
 * @brief
 *   Log a Tether message for the specified module in the 'Error'
 *   category.
 */
#define TetherLogError(MOD, MSG, ...)                                                                                              \
    ::tether::Logging::Log(::tether::Logging::kLogModule_##MOD, ::tether::Logging::kLogCategory_Error, MSG, ##__VA_ARGS__)
#else
#define TetherLogError(MOD, MSG, ...) ((void) 0)
#endif

#if TETHER_PROGRESS_LOGGING
/**
 * @def TetherLogProgress(MOD, MSG, ...)
 *
 * @brief
 *   Log a Tether message for the specified module in the 'Progress'
 *   category.
 */
#define TetherLogProgress(MOD, MSG, ...)                                                                                           \
    ::tether::Logging::Log(::tether::Logging::kLogModule_##MOD, ::tether::Logging::kLogCategory_Progress, MSG, ##__VA_ARGS__)
#else
#define TetherLogProgress(MOD, MSG, ...) ((void) 0)
#endif

#if TETHER_DETAIL_LOGGING
/**
 * @def TetherLogDetail(MOD, MSG, ...)
 *
 * @brief
 *   Log a Tether message for the specified module in the 'Detail'
 *   category.
 */
#define TetherLogDetail(MOD, MSG, ...)                                                                                             \
    ::tether::Logging::Log(::tether::Logging::kLogModule_##MOD, ::tether::Logging::kLogCategory_Detail, MSG, ##__VA_ARGS__)
#else
#define TetherLogDetail(MOD, MSG, ...) ((void) 0)
#endif

#if TETHER_AUTOMATION_LOGGING
#define TetherLogAutomation(MSG, ...)                                                                                              \
    ::tether::Logging::Log(::tether::Logging::kLogModule_Test, ::tether::Logging::kLogCategory_Automation, MSG, ##__VA_ARGS__)
#else
#define TetherLogAutomation(MSG, ...) ((void) 0)
#endif

/**
 * Formats a 64-bit value as two 32-bit halves, for platforms whose printf
 * lacks PRIx64.
 */
#define TetherLogFormatX64 "0x%08" PRIX32 "%08" PRIX32
#define TetherLogValueX64(aValue) static_cast<uint32_t>((aValue) >> 32), static_cast<uint32_t>(aValue)

/**
 * Logging helpers for exchanges. For now just log the exchange id and whether
 * it's an initiator or responder.
 */
#define TetherLogFormatExchangeId "%u%c"
#define TetherLogValueExchangeId(id, isInitiator) static_cast<unsigned>(id), ((isInitiator) ? 'i' : 'r')

/**
 * Logging helper for message counters.
 */
#define TetherLogFormatMessageCounter "%" PRIu32
