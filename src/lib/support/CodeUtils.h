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
 *      This file defines and implements a number of miscellaneous
 *      templates for finding object minima and maxima and interface
 *      macros for assertion checking.
 *
 */

#pragma once

#include <lib/core/TetherError.h>
#include <lib/support/logging/TetherLogging.h>

#include <stdlib.h>
#include <type_traits>

/**
 *  @def ReturnErrorOnFailure(expr)
 *
 *  @brief
 *    Returns the error code if the expression returns something different
 *    than TETHER_NO_ERROR.
 *
 *  Example usage:
 *
 *  @code
 *    ReturnErrorOnFailure(channel->SendMsg(msg));
 *  @endcode
 *
 *  @param[in]  expr        An expression to be tested.
 */
#define ReturnErrorOnFailure(expr)                                                                                                 \
    do                                                                                                                             \
    {                                                                                                                              \
        TETHER_ERROR __err = (expr);                                                                                               \
        if (!__err.IsSuccess())                                                                                                    \
        {                                                                                                                          \
            return __err;                                                                                                          \
        }                                                                                                                          \
    } while (false)

/**
 *  @def ReturnOnFailure(expr)
 *
 *  @brief
 *    Returns if the expression returns something different than
 *    TETHER_NO_ERROR.
 */
#define ReturnOnFailure(expr)                                                                                                      \
    do                                                                                                                             \
    {                                                                                                                              \
        TETHER_ERROR __err = (expr);                                                                                               \
        if (!__err.IsSuccess())                                                                                                    \
        {                                                                                                                          \
            return;                                                                                                                \
        }                                                                                                                          \
    } while (false)

/**
 *  @def VerifyOrReturn(expr, ...)
 *
 *  @brief
 *    Returns from the void function if expression evaluates to false
 *
 *  @param[in]  expr        A Boolean expression to be evaluated.
 *  @param[in]  ...         Statements to execute before returning. Optional.
 */
#define VerifyOrReturn(expr, ...)                                                                                                  \
    do                                                                                                                             \
    {                                                                                                                              \
        if (!(expr))                                                                                                               \
        {                                                                                                                          \
            __VA_ARGS__;                                                                                                           \
            return;                                                                                                                \
        }                                                                                                                          \
    } while (false)

/**
 *  @def VerifyOrReturnError(expr, code, ...)
 *
 *  @brief
 *    Returns a specified error code if expression evaluates to false
 *
 *  Example usage:
 *
 *  @code
 *    VerifyOrReturnError(param != nullptr, TETHER_ERROR_INVALID_ARGUMENT);
 *  @endcode
 *
 *  @param[in]  expr        A Boolean expression to be evaluated.
 *  @param[in]  code        A value to return if @a expr is false.
 *  @param[in]  ...         Statements to execute before returning. Optional.
 */
#define VerifyOrReturnError(expr, code, ...) VerifyOrReturnValue(expr, code, ##__VA_ARGS__)

/**
 *  @def VerifyOrReturnValue(expr, value, ...)
 *
 *  @brief
 *    Returns a specified value if expression evaluates to false
 *
 *  @param[in]  expr        A Boolean expression to be evaluated.
 *  @param[in]  value       A value to return if @a expr is false.
 *  @param[in]  ...         Statements to execute before returning. Optional.
 */
#define VerifyOrReturnValue(expr, value, ...)                                                                                      \
    do                                                                                                                             \
    {                                                                                                                              \
        if (!(expr))                                                                                                               \
        {                                                                                                                          \
            __VA_ARGS__;                                                                                                           \
            return (value);                                                                                                        \
        }                                                                                                                          \
    } while (false)

/**
 *  @def SuccessOrExit(error)
 *
 *  @brief
 *    This checks for the specified error, which is expected to
 *    commonly be successful (TETHER_NO_ERROR), and branches to
 *    the local label 'exit' if the error is not success.
 *
 *  @param[in]  error  A TETHER_ERROR to be evaluated against success.
 */
#define SuccessOrExit(error)                                                                                                       \
    do                                                                                                                             \
    {                                                                                                                              \
        if (!(error).IsSuccess())                                                                                                  \
        {                                                                                                                          \
            goto exit;                                                                                                             \
        }                                                                                                                          \
    } while (false)

/**
 *  @def VerifyOrExit(aCondition, anAction)
 *
 *  @brief
 *    Checks for the specified condition, which is expected to commonly be
 *    true, and both executes @a anAction and branches to the local label
 *    'exit' if the condition is false.
 */
#define VerifyOrExit(aCondition, anAction)                                                                                         \
    do                                                                                                                             \
    {                                                                                                                              \
        if (!(aCondition))                                                                                                         \
        {                                                                                                                          \
            anAction;                                                                                                              \
            goto exit;                                                                                                             \
        }                                                                                                                          \
    } while (false)

/**
 *  @def LogErrorOnFailure(expr)
 *
 *  @brief
 *    Logs a message if the expression returns something different than
 *    TETHER_NO_ERROR.
 *
 *  @param[in]  expr        A scalar expression to be evaluated against TETHER_NO_ERROR.
 */
#define LogErrorOnFailure(expr)                                                                                                    \
    do                                                                                                                             \
    {                                                                                                                              \
        TETHER_ERROR __err = (expr);                                                                                               \
        if (!__err.IsSuccess())                                                                                                    \
        {                                                                                                                          \
            TetherLogError(NotSpecified, "%s at %s:%d", __err.Format(), __FILE__, __LINE__);                                     \
        }                                                                                                                          \
    } while (false)

/**
 *  @def VerifyOrDie(aCondition)
 *
 *  @brief
 *    This checks for the specified condition, which is expected to
 *    commonly be true and forces an immediate abort if the condition
 *    is false.
 *
 *    Reserved for broken internal invariants; recoverable failures are
 *    returned as a TETHER_ERROR instead.
 */
#define VerifyOrDie(aCondition)                                                                                                    \
    do                                                                                                                             \
    {                                                                                                                              \
        if (!(aCondition))                                                                                                         \
        {                                                                                                                          \
            TetherLogError(Support, "VerifyOrDie failure at %s:%d: %s", __FILE__, __LINE__, #aCondition);                       \
            abort();                                                                                                               \
        }                                                                                                                          \
    } while (false)

namespace tether {

/**
 * Convert an enum value to its underlying type.
 */
template <typename T>
constexpr std::underlying_type_t<T> to_underlying(T e)
{
    static_assert(std::is_enum<T>::value, "to_underlying called to non-enum values.");
    return static_cast<std::underlying_type_t<T>>(e);
}

} // namespace tether

/**
 *  @def ArraySize(aArray)
 *
 *  @brief
 *    Returns the size of an array in number of elements.
 */
template <typename T, size_t N>
constexpr inline size_t ArraySize(T (&)[N]) noexcept
{
    return N;
}
