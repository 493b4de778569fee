/*
 *
 *    Copyright (c) 2020 Project CHIP Authors
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
 *      Optional values: a value of type T that may or may not be present.
 */

#pragma once

#include <new>
#include <type_traits>
#include <utility>

#include <lib/support/CodeUtils.h>

namespace tether {

/// An empty class type used to indicate optional type with uninitialized state.
struct NullOptionalType
{
    explicit NullOptionalType() = default;
};
inline constexpr NullOptionalType NullOptional{};

/**
 * Pairs an object with a boolean value to determine if the value exists
 * or not.
 */
template <class T>
class Optional
{
public:
    Optional() {}
    Optional(NullOptionalType) {}

    explicit Optional(const T & value) : mHasValue(true) { new (&mValue.mData) T(value); }
    explicit Optional(T && value) : mHasValue(true) { new (&mValue.mData) T(std::move(value)); }

    Optional(const Optional & other) : mHasValue(other.mHasValue)
    {
        if (mHasValue)
        {
            new (&mValue.mData) T(other.mValue.mData);
        }
    }

    Optional(Optional && other) : mHasValue(other.mHasValue)
    {
        if (mHasValue)
        {
            new (&mValue.mData) T(std::move(other.mValue.mData));
            other.ClearValue();
        }
    }

    ~Optional() { ClearValue(); }

    Optional & operator=(const Optional & other)
    {
        if (this != &other)
        {
            ClearValue();
            if (other.mHasValue)
            {
                new (&mValue.mData) T(other.mValue.mData);
                mHasValue = true;
            }
        }
        return *this;
    }

    Optional & operator=(Optional && other)
    {
        if (this != &other)
        {
            ClearValue();
            if (other.mHasValue)
            {
                new (&mValue.mData) T(std::move(other.mValue.mData));
                mHasValue = true;
                other.ClearValue();
            }
        }
        return *this;
    }

    /// Constructs the contained value in place
    template <class... Args>
    T & Emplace(Args &&... args)
    {
        ClearValue();
        new (&mValue.mData) T(std::forward<Args>(args)...);
        mHasValue = true;
        return mValue.mData;
    }

    /** Make the optional contain a specific value */
    void SetValue(const T & value) { Emplace(value); }
    void SetValue(T && value) { Emplace(std::move(value)); }

    /** Invalidate the value inside the optional. Optional now has no value */
    void ClearValue()
    {
        if (mHasValue)
        {
            mValue.mData.~T();
        }
        mHasValue = false;
    }

    /** Gets the current value of the optional. Valid IFF `HasValue`. */
    T & Value() &
    {
        VerifyOrDie(HasValue());
        return mValue.mData;
    }

    /** Gets the current value of the optional. Valid IFF `HasValue`. */
    const T & Value() const &
    {
        VerifyOrDie(HasValue());
        return mValue.mData;
    }

    /** Gets the current value of the optional if the optional has a value;
        otherwise returns the provided default value. */
    const T & ValueOr(const T & defaultValue) const { return HasValue() ? Value() : defaultValue; }

    /** Checks if the optional contains a value or not */
    bool HasValue() const { return mHasValue; }

    bool operator==(const Optional & other) const
    {
        return (mHasValue == other.mHasValue) && (!other.mHasValue || (mValue.mData == other.mValue.mData));
    }
    bool operator!=(const Optional & other) const { return !(*this == other); }
    bool operator==(const T & other) const { return HasValue() && Value() == other; }
    bool operator!=(const T & other) const { return !(*this == other); }

    /** Convenience method to create an optional without a valid value. */
    static Optional<T> Missing() { return Optional<T>(); }

private:
    bool mHasValue = false;
    union Storage
    {
        Storage() {}
        ~Storage() {}
        T mData;
    } mValue;
};

template <class T>
Optional<std::decay_t<T>> MakeOptional(T && value)
{
    return Optional<std::decay_t<T>>(std::forward<T>(value));
}

} // namespace tether
