/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef SEMVER_IDENTIFIER_HPP_
#define SEMVER_IDENTIFIER_HPP_

#include "semver/version/version.hpp"

namespace semver {

/**
 * Identifier validator.
 */
using IdentifierValidator = ParseError (*)(const String& identifier);

/**
 * Checks if identifier consists of digits only.
 *
 * @param identifier identifier.
 * @return bool.
 */
bool IsNumericIdentifier(const String& identifier);

/**
 * Parses numeric version core component: digits without leading zeros, fits into uint64_t.
 *
 * @param component component text.
 * @return RetWithError<uint64_t, ParseError>.
 */
RetWithError<uint64_t, ParseError> ParseNumericComponent(const String& component);

/**
 * Validates prerelease identifier: numeric without leading zeros or alphanumeric with hyphens.
 *
 * @param identifier identifier.
 * @return ParseError.
 */
ParseError ValidatePrereleaseIdentifier(const String& identifier);

/**
 * Validates build metadata identifier: non empty alphanumeric with hyphens.
 *
 * @param identifier identifier.
 * @return ParseError.
 */
ParseError ValidateBuildIdentifier(const String& identifier);

/**
 * Splits dot separated text into validated identifiers. Error positions are relative to the text start.
 *
 * @param text dot separated identifiers.
 * @param validator identifier validator.
 * @param[out] identifiers parsed identifiers.
 * @return ParseError.
 */
ParseError ParseIdentifiers(const String& text, IdentifierValidator validator, Array<Identifier>& identifiers);

/**
 * Returns length of decimal representation of number.
 *
 * @param value number.
 * @return size_t.
 */
size_t NumberLen(uint64_t value);

/**
 * Returns length of dot joined identifiers.
 *
 * @param identifiers identifiers.
 * @return size_t.
 */
size_t IdentifiersLen(const Array<Identifier>& identifiers);

} // namespace semver

#endif
