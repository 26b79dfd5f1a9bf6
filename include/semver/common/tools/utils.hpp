/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef SEMVER_UTILS_HPP_
#define SEMVER_UTILS_HPP_

#include <cstddef>

namespace semver {

/**
 * Defines array size.
 */
template <typename T, size_t cSize>
constexpr size_t ArraySize(T (&)[cSize])
{
    return cSize;
};

/**
 * Returns min from two value.
 */
template <typename T>
constexpr T Min(T a, T b)
{
    return (a < b) ? a : b;
};

/**
 * Remove const template.
 *
 * @tparam T const type.
 */
template <typename T>
struct RemoveConst {
    typedef T type;
};

/**
 * Remove const template.
 *
 * @tparam T const type.
 */
template <typename T>
struct RemoveConst<const T> {
    typedef T type;
};

template <class T>
using RemoveConstType = typename RemoveConst<T>::type;

} // namespace semver

#endif
