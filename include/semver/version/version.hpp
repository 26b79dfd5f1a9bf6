/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef SEMVER_VERSION_HPP_
#define SEMVER_VERSION_HPP_

#include <cstdint>

#include "semver/common/config.hpp"
#include "semver/common/tools/array.hpp"
#include "semver/common/tools/error.hpp"
#include "semver/common/tools/log.hpp"
#include "semver/common/tools/string.hpp"

namespace semver {

/**
 * Max length of version canonical text.
 */
constexpr auto cVersionLen = SEMVER_CONFIG_VERSION_LEN;

/**
 * Max length of prerelease or build identifier.
 */
constexpr auto cIdentifierLen = SEMVER_CONFIG_IDENTIFIER_LEN;

/**
 * Max number of prerelease or build identifiers.
 */
constexpr auto cMaxNumIdentifiers = SEMVER_CONFIG_MAX_NUM_IDENTIFIERS;

/**
 * Prerelease or build identifier.
 */
using Identifier = StaticString<cIdentifierLen>;

/**
 * Prerelease or build identifiers.
 */
using IdentifierArray = StaticArray<Identifier, cMaxNumIdentifiers>;

/**
 * Version parse error.
 *
 * Error codes:
 *   eInvalidArgument - text violates version grammar;
 *   eOutOfRange      - numeric component doesn't fit into uint64_t;
 *   eNoMemory        - text exceeds identifier or version capacity.
 */
class ParseError : public Error {
public:
    // cppcheck-suppress noExplicitConstructor
    /**
     * Creates parse error.
     *
     * @param err error code.
     * @param message static error message.
     * @param position byte position of offending fragment.
     * @param fragment offending fragment.
     */
    ParseError(ErrorEnum err = ErrorEnum::eNone, const char* message = nullptr, size_t position = 0,
        const String& fragment = "")
        : Error(err, message)
        , mPosition(position)
    {
        SetFragment(fragment);
    }

    /**
     * Creates parse error from generic error.
     *
     * @param err error.
     * @param position byte position of offending fragment.
     * @param fragment offending fragment.
     */
    ParseError(const Error& err, size_t position, const String& fragment = "")
        : Error(err)
        , mPosition(position)
    {
        SetFragment(fragment);
    }

    /**
     * Returns byte position of offending fragment.
     *
     * @return size_t.
     */
    size_t Position() const { return mPosition; }

    /**
     * Returns offending fragment. Truncated to cIdentifierLen.
     *
     * @return const String&.
     */
    const String& Fragment() const { return mFragment; }

    /**
     * Returns error with position shifted by offset.
     *
     * @param offset position offset.
     * @return ParseError.
     */
    ParseError Shift(size_t offset) const
    {
        auto err = *this;

        if (!err.IsNone()) {
            err.mPosition += offset;
        }

        return err;
    }

    /**
     * Outputs parse error to log.
     *
     * @param log log to output.
     * @param err parse error.
     *
     * @return Log&.
     */
    friend Log& operator<<(Log& log, const ParseError& err)
    {
        log << static_cast<const Error&>(err);

        if (err.IsNone()) {
            return log;
        }

        return log << ": pos=" << err.mPosition << ", fragment=" << err.mFragment;
    }

private:
    void SetFragment(const String& fragment)
    {
        mFragment = String(fragment.CStr(), Min(fragment.Size(), mFragment.MaxSize()));
    }

    size_t     mPosition = 0;
    Identifier mFragment;
};

/**
 * Semantic version. Immutable: there are no mutators, new versions are derived from existing ones.
 */
class Version {
public:
    /**
     * Creates 0.0.0 version.
     */
    Version() = default;

    /**
     * Creates release version without build metadata.
     *
     * @param major major version.
     * @param minor minor version.
     * @param patch patch version.
     */
    Version(uint64_t major, uint64_t minor, uint64_t patch)
        : mMajor(major)
        , mMinor(minor)
        , mPatch(patch)
    {
    }

    /**
     * Creates version from components. Prerelease and build are dot separated identifiers, empty text means absent
     * part, so an empty prerelease can't be expressed here. Use the identifiers overload to pass absent parts
     * explicitly: an empty array is absent, an empty identifier is rejected.
     *
     * @param major major version.
     * @param minor minor version.
     * @param patch patch version.
     * @param prerelease prerelease text.
     * @param build build metadata text.
     * @return RetWithError<Version, ParseError>.
     */
    static RetWithError<Version, ParseError> Create(
        uint64_t major, uint64_t minor, uint64_t patch, const String& prerelease = "", const String& build = "");

    /**
     * Creates version from components. Empty arrays mean absent prerelease or build metadata.
     *
     * @param major major version.
     * @param minor minor version.
     * @param patch patch version.
     * @param prerelease prerelease identifiers.
     * @param build build metadata identifiers.
     * @return RetWithError<Version, ParseError>.
     */
    static RetWithError<Version, ParseError> Create(uint64_t major, uint64_t minor, uint64_t patch,
        const Array<Identifier>& prerelease, const Array<Identifier>& build);

    /**
     * Returns major version.
     *
     * @return uint64_t.
     */
    uint64_t Major() const { return mMajor; }

    /**
     * Returns minor version.
     *
     * @return uint64_t.
     */
    uint64_t Minor() const { return mMinor; }

    /**
     * Returns patch version.
     *
     * @return uint64_t.
     */
    uint64_t Patch() const { return mPatch; }

    /**
     * Returns prerelease identifiers.
     *
     * @return const Array<Identifier>&.
     */
    const Array<Identifier>& Prerelease() const { return mPrerelease; }

    /**
     * Returns build metadata identifiers.
     *
     * @return const Array<Identifier>&.
     */
    const Array<Identifier>& Build() const { return mBuild; }

    /**
     * Checks if version is prerelease.
     *
     * @return bool.
     */
    bool IsPrerelease() const { return !mPrerelease.IsEmpty(); }

    /**
     * Checks if version has build metadata.
     *
     * @return bool.
     */
    bool HasBuild() const { return !mBuild.IsEmpty(); }

    /**
     * Returns canonical text: major.minor.patch[-prerelease][+build].
     *
     * @return StaticString<cVersionLen>.
     */
    StaticString<cVersionLen> ToString() const;

    /**
     * Returns version with incremented major and zero minor and patch.
     *
     * @param keepPrerelease keeps prerelease identifiers if set.
     * @param keepBuild keeps build metadata if set.
     * @return RetWithError<Version, ParseError>.
     */
    RetWithError<Version, ParseError> BumpMajor(bool keepPrerelease = false, bool keepBuild = false) const;

    /**
     * Returns version with incremented minor and zero patch.
     *
     * @param keepPrerelease keeps prerelease identifiers if set.
     * @param keepBuild keeps build metadata if set.
     * @return RetWithError<Version, ParseError>.
     */
    RetWithError<Version, ParseError> BumpMinor(bool keepPrerelease = false, bool keepBuild = false) const;

    /**
     * Returns version with incremented patch.
     *
     * @param keepPrerelease keeps prerelease identifiers if set.
     * @param keepBuild keeps build metadata if set.
     * @return RetWithError<Version, ParseError>.
     */
    RetWithError<Version, ParseError> BumpPatch(bool keepPrerelease = false, bool keepBuild = false) const;

    /**
     * Returns version with replaced prerelease. Empty text removes prerelease.
     *
     * @param prerelease prerelease text.
     * @return RetWithError<Version, ParseError>.
     */
    RetWithError<Version, ParseError> WithPrerelease(const String& prerelease) const;

    /**
     * Returns version with replaced build metadata. Empty text removes build metadata.
     *
     * @param build build metadata text.
     * @return RetWithError<Version, ParseError>.
     */
    RetWithError<Version, ParseError> WithBuild(const String& build) const;

    /**
     * Checks versions identity including build metadata. Use Equals() for precedence equality.
     *
     * @param version version to compare with.
     * @return bool.
     */
    bool operator==(const Version& version) const;

    /**
     * Checks versions difference including build metadata.
     *
     * @param version version to compare with.
     * @return bool.
     */
    bool operator!=(const Version& version) const { return !operator==(version); }

    /**
     * Precedence comparison operators.
     */
    bool operator<(const Version& version) const;
    bool operator<=(const Version& version) const;
    bool operator>(const Version& version) const;
    bool operator>=(const Version& version) const;

    /**
     * Outputs version to log.
     *
     * @param log log to output.
     * @param version version.
     *
     * @return Log&.
     */
    friend Log& operator<<(Log& log, const Version& version) { return log << version.ToString(); }

private:
    uint64_t        mMajor = 0;
    uint64_t        mMinor = 0;
    uint64_t        mPatch = 0;
    IdentifierArray mPrerelease;
    IdentifierArray mBuild;
};

/**
 * Version hash consistent with identity comparison: build metadata is taken into account.
 */
struct VersionHash {
    size_t operator()(const Version& version) const;
};

} // namespace semver

#endif
