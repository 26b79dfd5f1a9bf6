/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "semver/version/version.hpp"

#include "identifier.hpp"

namespace semver {

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

namespace {

ParseError ValidateIdentifiers(
    const Array<Identifier>& identifiers, IdentifierValidator validator, size_t offset, size_t& len)
{
    if (identifiers.Size() > cMaxNumIdentifiers) {
        return ParseError(ErrorEnum::eNoMemory, "too many identifiers", offset);
    }

    for (const auto& identifier : identifiers) {
        if (auto err = validator(identifier); !err.IsNone()) {
            return err.Shift(offset + len);
        }

        len += identifier.Size() + 1;
    }

    return ErrorEnum::eNone;
}

size_t CoreLen(uint64_t major, uint64_t minor, uint64_t patch)
{
    return NumberLen(major) + NumberLen(minor) + NumberLen(patch) + 2;
}

RetWithError<uint64_t, ParseError> Increment(uint64_t value)
{
    if (value == UINT64_MAX) {
        return {0, ParseError(ErrorEnum::eOutOfRange, "numeric component overflow")};
    }

    return value + 1;
}

} // namespace

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

RetWithError<Version, ParseError> Version::Create(
    uint64_t major, uint64_t minor, uint64_t patch, const String& prerelease, const String& build)
{
    IdentifierArray prereleaseIdentifiers;
    IdentifierArray buildIdentifiers;
    size_t          offset = CoreLen(major, minor, patch) + 1;

    if (!prerelease.IsEmpty()) {
        if (auto err = ParseIdentifiers(prerelease, ValidatePrereleaseIdentifier, prereleaseIdentifiers);
            !err.IsNone()) {
            return {Version(), err.Shift(offset)};
        }

        offset += prerelease.Size() + 1;
    }

    if (!build.IsEmpty()) {
        if (auto err = ParseIdentifiers(build, ValidateBuildIdentifier, buildIdentifiers); !err.IsNone()) {
            return {Version(), err.Shift(offset)};
        }
    }

    return Create(major, minor, patch, prereleaseIdentifiers, buildIdentifiers);
}

RetWithError<Version, ParseError> Version::Create(uint64_t major, uint64_t minor, uint64_t patch,
    const Array<Identifier>& prerelease, const Array<Identifier>& build)
{
    // Error positions point to the canonical text of the version being created.
    size_t len = CoreLen(major, minor, patch);

    if (!prerelease.IsEmpty()) {
        size_t prereleaseLen = 0;

        if (auto err = ValidateIdentifiers(prerelease, ValidatePrereleaseIdentifier, len + 1, prereleaseLen);
            !err.IsNone()) {
            return {Version(), err};
        }

        len += prereleaseLen;
    }

    if (!build.IsEmpty()) {
        size_t buildLen = 0;

        if (auto err = ValidateIdentifiers(build, ValidateBuildIdentifier, len + 1, buildLen); !err.IsNone()) {
            return {Version(), err};
        }

        len += buildLen;
    }

    if (len > cVersionLen) {
        return {Version(), ParseError(ErrorEnum::eNoMemory, "version too long", cVersionLen)};
    }

    Version version(major, minor, patch);

    version.mPrerelease = prerelease;
    version.mBuild      = build;

    return version;
}

StaticString<cVersionLen> Version::ToString() const
{
    StaticString<cVersionLen> str;
    StaticString<24>          number;

    auto appendIdentifiers = [&str](char separator, const Array<Identifier>& identifiers) {
        for (const auto& identifier : identifiers) {
            [[maybe_unused]] auto err = str.Append(separator);
            assert(err.IsNone());

            err = str.Append(identifier);
            assert(err.IsNone());

            separator = '.';
        }
    };

    const uint64_t components[] = {mMajor, mMinor, mPatch};

    for (size_t i = 0; i < ArraySize(components); i++) {
        if (i != 0) {
            [[maybe_unused]] auto err = str.Append('.');
            assert(err.IsNone());
        }

        [[maybe_unused]] auto err = number.Convert(components[i]);
        assert(err.IsNone());

        err = str.Append(number);
        assert(err.IsNone());
    }

    appendIdentifiers('-', mPrerelease);
    appendIdentifiers('+', mBuild);

    return str;
}

RetWithError<Version, ParseError> Version::BumpMajor(bool keepPrerelease, bool keepBuild) const
{
    auto major = Increment(mMajor);
    if (!major.mError.IsNone()) {
        return {Version(), major.mError};
    }

    return Create(major.mValue, 0, 0, keepPrerelease ? mPrerelease : IdentifierArray(),
        keepBuild ? mBuild : IdentifierArray());
}

RetWithError<Version, ParseError> Version::BumpMinor(bool keepPrerelease, bool keepBuild) const
{
    auto minor = Increment(mMinor);
    if (!minor.mError.IsNone()) {
        return {Version(), minor.mError};
    }

    return Create(mMajor, minor.mValue, 0, keepPrerelease ? mPrerelease : IdentifierArray(),
        keepBuild ? mBuild : IdentifierArray());
}

RetWithError<Version, ParseError> Version::BumpPatch(bool keepPrerelease, bool keepBuild) const
{
    auto patch = Increment(mPatch);
    if (!patch.mError.IsNone()) {
        return {Version(), patch.mError};
    }

    return Create(mMajor, mMinor, patch.mValue, keepPrerelease ? mPrerelease : IdentifierArray(),
        keepBuild ? mBuild : IdentifierArray());
}

RetWithError<Version, ParseError> Version::WithPrerelease(const String& prerelease) const
{
    IdentifierArray identifiers;

    if (!prerelease.IsEmpty()) {
        if (auto err = ParseIdentifiers(prerelease, ValidatePrereleaseIdentifier, identifiers); !err.IsNone()) {
            return {Version(), err.Shift(CoreLen(mMajor, mMinor, mPatch) + 1)};
        }
    }

    return Create(mMajor, mMinor, mPatch, identifiers, mBuild);
}

RetWithError<Version, ParseError> Version::WithBuild(const String& build) const
{
    IdentifierArray identifiers;

    if (!build.IsEmpty()) {
        auto offset = CoreLen(mMajor, mMinor, mPatch) + 1;

        if (IsPrerelease()) {
            offset += IdentifiersLen(mPrerelease) + 1;
        }

        if (auto err = ParseIdentifiers(build, ValidateBuildIdentifier, identifiers); !err.IsNone()) {
            return {Version(), err.Shift(offset)};
        }
    }

    return Create(mMajor, mMinor, mPatch, mPrerelease, identifiers);
}

bool Version::operator==(const Version& version) const
{
    return mMajor == version.mMajor && mMinor == version.mMinor && mPatch == version.mPatch
        && mPrerelease == version.mPrerelease && mBuild == version.mBuild;
}

size_t VersionHash::operator()(const Version& version) const
{
    // FNV-1a over canonical text: equal versions have equal text.
    constexpr uint64_t cFNVOffsetBasis = 14695981039346656037ULL;
    constexpr uint64_t cFNVPrime       = 1099511628211ULL;

    uint64_t hash = cFNVOffsetBasis;

    for (const auto ch : version.ToString()) {
        hash ^= static_cast<uint8_t>(ch);
        hash *= cFNVPrime;
    }

    return static_cast<size_t>(hash);
}

} // namespace semver
