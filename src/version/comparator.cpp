/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "semver/version/comparator.hpp"

#include "identifier.hpp"

namespace semver {

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

namespace {

template <typename T>
int CompareValues(const T& value1, const T& value2)
{
    if (value1 < value2) {
        return -1;
    }

    if (value2 < value1) {
        return 1;
    }

    return 0;
}

// Numeric identifiers have no leading zeros, so longer one is greater. It allows to compare identifiers of any length.
int CompareNumericIdentifiers(const String& identifier1, const String& identifier2)
{
    if (auto result = CompareValues(identifier1.Size(), identifier2.Size()); result != 0) {
        return result;
    }

    return identifier1.CompareTo(identifier2);
}

int CompareIdentifiers(const String& identifier1, const String& identifier2)
{
    auto isNumeric1 = IsNumericIdentifier(identifier1);
    auto isNumeric2 = IsNumericIdentifier(identifier2);

    if (isNumeric1 && isNumeric2) {
        return CompareNumericIdentifiers(identifier1, identifier2);
    }

    if (isNumeric1) {
        return -1;
    }

    if (isNumeric2) {
        return 1;
    }

    return identifier1.CompareTo(identifier2);
}

int ComparePrerelease(const Array<Identifier>& prerelease1, const Array<Identifier>& prerelease2)
{
    // Release has higher precedence than prerelease.
    if (prerelease1.IsEmpty() || prerelease2.IsEmpty()) {
        return CompareValues(prerelease1.IsEmpty(), prerelease2.IsEmpty());
    }

    for (size_t i = 0; i < Min(prerelease1.Size(), prerelease2.Size()); i++) {
        if (auto result = CompareIdentifiers(prerelease1[i], prerelease2[i]); result != 0) {
            return result;
        }
    }

    return CompareValues(prerelease1.Size(), prerelease2.Size());
}

int CompareVersions(const Version& version1, const Version& version2)
{
    if (auto result = CompareValues(version1.Major(), version2.Major()); result != 0) {
        return result;
    }

    if (auto result = CompareValues(version1.Minor(), version2.Minor()); result != 0) {
        return result;
    }

    if (auto result = CompareValues(version1.Patch(), version2.Patch()); result != 0) {
        return result;
    }

    return ComparePrerelease(version1.Prerelease(), version2.Prerelease());
}

} // namespace

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

Ordering Compare(const Version& version1, const Version& version2)
{
    auto result = CompareVersions(version1, version2);

    if (result < 0) {
        return OrderingEnum::eLess;
    }

    if (result > 0) {
        return OrderingEnum::eGreater;
    }

    return OrderingEnum::eEqual;
}

bool Equals(const Version& version1, const Version& version2)
{
    return CompareVersions(version1, version2) == 0;
}

bool LessThan(const Version& version1, const Version& version2)
{
    return CompareVersions(version1, version2) < 0;
}

bool LessOrEqual(const Version& version1, const Version& version2)
{
    return CompareVersions(version1, version2) <= 0;
}

bool GreaterThan(const Version& version1, const Version& version2)
{
    return CompareVersions(version1, version2) > 0;
}

bool GreaterOrEqual(const Version& version1, const Version& version2)
{
    return CompareVersions(version1, version2) >= 0;
}

void SortVersions(Array<Version>& versions)
{
    Version tmpVersion;

    versions.Sort(PrecedenceLess(), tmpVersion);
}

bool Version::operator<(const Version& version) const
{
    return LessThan(*this, version);
}

bool Version::operator<=(const Version& version) const
{
    return LessOrEqual(*this, version);
}

bool Version::operator>(const Version& version) const
{
    return GreaterThan(*this, version);
}

bool Version::operator>=(const Version& version) const
{
    return GreaterOrEqual(*this, version);
}

} // namespace semver
