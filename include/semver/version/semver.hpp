/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef SEMVER_SEMVER_HPP_
#define SEMVER_SEMVER_HPP_

#include "semver/version/comparator.hpp"
#include "semver/version/parser.hpp"

namespace semver {

/**
 * Validates semantic version.
 *
 * @param version version to validate.
 * @return Error.
 */
Error ValidateSemver(const String& version);

/**
 * Compares two semantic versions.
 *
 * @param version1 first version.
 * @param version2 second version.
 * @return RetWithError<int> -1, 0 or 1 if first version has lower, equal or higher precedence.
 */
RetWithError<int> CompareSemver(const String& version1, const String& version2);

} // namespace semver

#endif
