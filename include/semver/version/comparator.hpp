/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef SEMVER_COMPARATOR_HPP_
#define SEMVER_COMPARATOR_HPP_

#include "semver/common/tools/enum.hpp"
#include "semver/version/version.hpp"

namespace semver {

/**
 * Version precedence ordering.
 */
class OrderingType {
public:
    enum class Enum {
        eLess,
        eEqual,
        eGreater,
    };

    static const Array<const char* const> GetStrings()
    {
        static const char* const sOrderingStrings[] = {"less", "equal", "greater"};

        return Array<const char* const>(sOrderingStrings, ArraySize(sOrderingStrings));
    };
};

using OrderingEnum = OrderingType::Enum;
using Ordering     = EnumStringer<OrderingType>;

/**
 * Compares versions precedence. Build metadata is ignored.
 *
 * @param version1 first version.
 * @param version2 second version.
 * @return Ordering of the first version relative to the second one.
 */
Ordering Compare(const Version& version1, const Version& version2);

/**
 * Checks if versions have equal precedence.
 *
 * @param version1 first version.
 * @param version2 second version.
 * @return bool.
 */
bool Equals(const Version& version1, const Version& version2);

/**
 * Checks if first version has lower precedence.
 *
 * @param version1 first version.
 * @param version2 second version.
 * @return bool.
 */
bool LessThan(const Version& version1, const Version& version2);

/**
 * Checks if first version has lower or equal precedence.
 *
 * @param version1 first version.
 * @param version2 second version.
 * @return bool.
 */
bool LessOrEqual(const Version& version1, const Version& version2);

/**
 * Checks if first version has higher precedence.
 *
 * @param version1 first version.
 * @param version2 second version.
 * @return bool.
 */
bool GreaterThan(const Version& version1, const Version& version2);

/**
 * Checks if first version has higher or equal precedence.
 *
 * @param version1 first version.
 * @param version2 second version.
 * @return bool.
 */
bool GreaterOrEqual(const Version& version1, const Version& version2);

/**
 * Precedence less than comparator.
 */
struct PrecedenceLess {
    bool operator()(const Version& version1, const Version& version2) const { return LessThan(version1, version2); }
};

/**
 * Sorts versions by ascending precedence. Versions with equal precedence keep their relative order.
 *
 * @param versions versions to sort.
 */
void SortVersions(Array<Version>& versions);

} // namespace semver

#endif
