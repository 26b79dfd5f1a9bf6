/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef SEMVER_ENUM_HPP_
#define SEMVER_ENUM_HPP_

#include "semver/common/tools/array.hpp"

namespace semver {

/**
 * Converts enum value to string.
 *
 * @tparam T type which defines Enum and GetStrings().
 */
template <class T>
class EnumStringer {
public:
    using EnumType = typename T::Enum;

    // cppcheck-suppress noExplicitConstructor
    /**
     * Creates enum stringer.
     *
     * @param value enum value.
     */
    constexpr EnumStringer(EnumType value = static_cast<EnumType>(0))
        : mValue(value)
    {
    }

    /**
     * Returns enum value.
     *
     * @return EnumType.
     */
    EnumType GetValue() const { return mValue; };

    /**
     * Returns enum string representation.
     *
     * @return const char*.
     */
    const char* ToString() const
    {
        auto strings = T::GetStrings();
        auto index   = static_cast<size_t>(mValue);

        if (index >= strings.Size()) {
            return "unknown";
        }

        return strings[index];
    };

    /**
     * Compares enum stringers.
     */
    bool operator==(const EnumStringer<T>& stringer) const { return mValue == stringer.mValue; };
    bool operator!=(const EnumStringer<T>& stringer) const { return mValue != stringer.mValue; };
    bool operator==(EnumType value) const { return mValue == value; };
    bool operator!=(EnumType value) const { return mValue != value; };

private:
    EnumType mValue;
};

} // namespace semver

#endif
