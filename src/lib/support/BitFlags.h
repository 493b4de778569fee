/*
 *
 *    Copyright (c) 2020 Project CHIP Authors
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
 *      This file defines functions for manipulating Boolean flags in
 *      a bitfield.
 *
 */

#pragma once

#include <stdint.h>

#include <type_traits>
#include <utility>

namespace tether {

/**
 * Stores bit flags in a type safe manner.
 *
 * @tparam FlagsEnum is an `enum` or (preferably) `enum class` type.
 * @tparam StorageType is the underlying storage type (like uint16_t, uint32_t etc.)
 *         and defaults to the underlying storage type of `FlagsEnum`.
 */
template <typename FlagsEnum, typename StorageType = typename std::underlying_type_t<FlagsEnum>>
class BitFlags
{
public:
    static_assert(sizeof(StorageType) >= sizeof(FlagsEnum), "All flags should fit in the storage type");
    using IntegerType = StorageType;

    BitFlags() : mValue(0) {}
    BitFlags(const BitFlags & other) = default;
    BitFlags & operator=(const BitFlags &) = default;

    explicit BitFlags(FlagsEnum value) : mValue(static_cast<IntegerType>(value)) {}
    explicit BitFlags(IntegerType value) : mValue(value) {}

    template <typename... Args>
    BitFlags(FlagsEnum flag, Args &&... args) : mValue(Or(flag, std::forward<Args>(args)...))
    {}

    /**
     * Set flag(s).
     *
     * @param other     Flag(s) to set. Any flags not set in @a other are unaffected.
     */
    BitFlags & Set(const BitFlags & other)
    {
        mValue |= other.mValue;
        return *this;
    }

    /**
     * Set flag(s).
     *
     * @param flag      Typed flag(s) to set. Any flags not in @a v are unaffected.
     */
    BitFlags & Set(FlagsEnum flag)
    {
        mValue |= static_cast<IntegerType>(flag);
        return *this;
    }

    /**
     * Set or clear flag(s).
     *
     * @param flag      Typed flag(s) to set or clear. Any flags not in @a flag are unaffected.
     * @param isSet     If true, set the flag; if false, clear it.
     */
    BitFlags & Set(FlagsEnum flag, bool isSet) { return isSet ? Set(flag) : Clear(flag); }

    /**
     * Clear flag(s).
     *
     * @param flag      Typed flag(s) to clear. Any flags not in @a flag are unaffected.
     */
    BitFlags & Clear(FlagsEnum flag)
    {
        mValue &= static_cast<IntegerType>(~static_cast<IntegerType>(flag));
        return *this;
    }

    /**
     * Clear all flags.
     */
    BitFlags & ClearAll()
    {
        mValue = 0;
        return *this;
    }

    /**
     * Check whether flag(s) are set.
     *
     * @param flag      Flag(s) to test.
     * @returns         True if all flag(s) in @a flag are set.
     */
    bool Has(FlagsEnum flag) const { return (mValue & static_cast<IntegerType>(flag)) == static_cast<IntegerType>(flag); }

    /**
     * Check that no flags outside the arguments are set.
     *
     * @param args      Flags to test. Arguments can be BitFlags<FlagsEnum>, BitFlags<FlagsEnum>, or FlagsEnum.
     * @returns         True if no flag is set other than those passed.
     *                  False if any flag is set other than those passed.
     */
    template <typename... Args>
    bool HasOnly(Args &&... args) const
    {
        return (mValue & Or(std::forward<Args>(args)...)) == mValue;
    }

    /**
     * Check whether any flag is set.
     *
     * @returns         True if any flag is set, false otherwise.
     */
    bool HasAny() const { return mValue != 0; }

    /**
     * Get the flags as the type FlagsEnum.
     */
    FlagsEnum Get() const { return static_cast<FlagsEnum>(mValue); }

    /**
     * Get the flags as the underlying integer type.
     */
    IntegerType Raw() const { return mValue; }

    /**
     * Set the flags to a given raw value.
     */
    BitFlags & SetRaw(IntegerType value)
    {
        mValue = value;
        return *this;
    }

    bool operator==(const BitFlags & other) const { return mValue == other.mValue; }
    bool operator!=(const BitFlags & other) const { return mValue != other.mValue; }

private:
    static IntegerType Or(FlagsEnum value) { return static_cast<IntegerType>(value); }
    static IntegerType Or(const BitFlags & value) { return value.Raw(); }

    template <typename... Args>
    static IntegerType Or(FlagsEnum first, Args &&... rest)
    {
        return static_cast<IntegerType>(static_cast<IntegerType>(first) | Or(std::forward<Args>(rest)...));
    }

    IntegerType mValue = 0;
};

} // namespace tether
