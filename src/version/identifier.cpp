/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "identifier.hpp"

namespace semver {

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

namespace {

bool IsDigit(char ch)
{
    return ch >= '0' && ch <= '9';
}

bool IsIdentifierChar(char ch)
{
    return IsDigit(ch) || (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || ch == '-';
}

ParseError ValidateIdentifierChars(const String& identifier)
{
    if (identifier.IsEmpty()) {
        return ParseError(ErrorEnum::eInvalidArgument, "empty identifier", 0, identifier);
    }

    for (size_t i = 0; i < identifier.Size(); i++) {
        if (!IsIdentifierChar(identifier[i])) {
            return ParseError(ErrorEnum::eInvalidArgument, "invalid identifier character", i, identifier);
        }
    }

    if (identifier.Size() > cIdentifierLen) {
        return ParseError(ErrorEnum::eNoMemory, "identifier too long", 0, identifier);
    }

    return ErrorEnum::eNone;
}

} // namespace

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

bool IsNumericIdentifier(const String& identifier)
{
    if (identifier.IsEmpty()) {
        return false;
    }

    for (const auto ch : identifier) {
        if (!IsDigit(ch)) {
            return false;
        }
    }

    return true;
}

RetWithError<uint64_t, ParseError> ParseNumericComponent(const String& component)
{
    if (component.IsEmpty()) {
        return {0, ParseError(ErrorEnum::eInvalidArgument, "empty numeric component", 0, component)};
    }

    for (size_t i = 0; i < component.Size(); i++) {
        if (!IsDigit(component[i])) {
            return {0, ParseError(ErrorEnum::eInvalidArgument, "non-digit in numeric component", i, component)};
        }
    }

    if (component.Size() > 1 && component[0] == '0') {
        return {0, ParseError(ErrorEnum::eInvalidArgument, "leading zero in numeric component", 0, component)};
    }

    auto result = component.ToUint64();
    if (!result.mError.IsNone()) {
        return {0, ParseError(Error(result.mError, "numeric component overflow"), 0, component)};
    }

    return result.mValue;
}

ParseError ValidatePrereleaseIdentifier(const String& identifier)
{
    if (auto err = ValidateIdentifierChars(identifier); !err.IsNone()) {
        return err;
    }

    if (IsNumericIdentifier(identifier) && identifier.Size() > 1 && identifier[0] == '0') {
        return ParseError(ErrorEnum::eInvalidArgument, "leading zero in numeric identifier", 0, identifier);
    }

    return ErrorEnum::eNone;
}

ParseError ValidateBuildIdentifier(const String& identifier)
{
    return ValidateIdentifierChars(identifier);
}

ParseError ParseIdentifiers(const String& text, IdentifierValidator validator, Array<Identifier>& identifiers)
{
    identifiers.Clear();

    size_t start = 0;

    while (true) {
        auto end = text.FindChar(start, '.').mValue;

        String identifier(text.CStr() + start, end - start);

        if (auto err = validator(identifier); !err.IsNone()) {
            return err.Shift(start);
        }

        if (identifiers.Size() >= cMaxNumIdentifiers) {
            return ParseError(ErrorEnum::eNoMemory, "too many identifiers", start, identifier);
        }

        if (auto err = identifiers.EmplaceBack(identifier); !err.IsNone()) {
            return ParseError(Error(err, "too many identifiers"), start, identifier);
        }

        if (end == text.Size()) {
            break;
        }

        start = end + 1;
    }

    return ErrorEnum::eNone;
}

size_t NumberLen(uint64_t value)
{
    size_t len = 1;

    while (value >= 10) {
        value /= 10;
        len++;
    }

    return len;
}

size_t IdentifiersLen(const Array<Identifier>& identifiers)
{
    if (identifiers.IsEmpty()) {
        return 0;
    }

    size_t len = identifiers.Size() - 1;

    for (const auto& identifier : identifiers) {
        len += identifier.Size();
    }

    return len;
}

} // namespace semver
