/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "semver/version/parser.hpp"

#include "identifier.hpp"

namespace semver {

/***********************************************************************************************************************
 * Consts
 **********************************************************************************************************************/

namespace {

constexpr size_t cNumCoreComponents = 3;

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

ParseError ParseCore(const String& core, uint64_t (&components)[cNumCoreComponents])
{
    size_t start = 0;

    for (size_t i = 0; i < cNumCoreComponents; i++) {
        auto end = core.FindChar(start, '.').mValue;

        if (i < cNumCoreComponents - 1 && end == core.Size()) {
            return ParseError(ErrorEnum::eInvalidArgument, "missing version core component", core.Size(), core);
        }

        if (i == cNumCoreComponents - 1 && end != core.Size()) {
            return ParseError(ErrorEnum::eInvalidArgument, "too many version core components", end, core);
        }

        auto result = ParseNumericComponent(String(core.CStr() + start, end - start));
        if (!result.mError.IsNone()) {
            return result.mError.Shift(start);
        }

        components[i] = result.mValue;
        start         = end + 1;
    }

    return ErrorEnum::eNone;
}

ParseError ParseSection(const String& text, size_t separatorPos, size_t endPos, IdentifierValidator validator,
    const char* emptyMessage, Array<Identifier>& identifiers)
{
    auto start = separatorPos + 1;

    if (start == endPos) {
        return ParseError(
            ErrorEnum::eInvalidArgument, emptyMessage, separatorPos, String(text.CStr() + separatorPos, 1));
    }

    if (auto err = ParseIdentifiers(String(text.CStr() + start, endPos - start), validator, identifiers);
        !err.IsNone()) {
        return err.Shift(start);
    }

    return ErrorEnum::eNone;
}

} // namespace

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

RetWithError<Version, ParseError> ParseVersion(const String& text)
{
    if (text.IsEmpty()) {
        return {Version(), ParseError(ErrorEnum::eInvalidArgument, "empty version")};
    }

    if (text.Size() > cVersionLen) {
        return {Version(), ParseError(ErrorEnum::eNoMemory, "version too long", cVersionLen)};
    }

    // Core and prerelease can't contain "+", core can't contain "-": the first "+" starts build metadata and the first
    // "-" before it starts prerelease.
    auto buildPos      = text.FindChar(0, '+').mValue;
    auto prereleasePos = Min(text.FindChar(0, '-').mValue, buildPos);

    uint64_t components[cNumCoreComponents] = {};

    if (auto err = ParseCore(String(text.CStr(), prereleasePos), components); !err.IsNone()) {
        return {Version(), err};
    }

    IdentifierArray prerelease;
    IdentifierArray build;

    if (prereleasePos < buildPos) {
        if (auto err = ParseSection(
                text, prereleasePos, buildPos, ValidatePrereleaseIdentifier, "empty prerelease", prerelease);
            !err.IsNone()) {
            return {Version(), err};
        }
    }

    if (buildPos < text.Size()) {
        if (auto err
            = ParseSection(text, buildPos, text.Size(), ValidateBuildIdentifier, "empty build metadata", build);
            !err.IsNone()) {
            return {Version(), err};
        }
    }

    return Version::Create(components[0], components[1], components[2], prerelease, build);
}

} // namespace semver
