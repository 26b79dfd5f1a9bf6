/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef SEMVER_TEST_UTILS_HPP_
#define SEMVER_TEST_UTILS_HPP_

#include <string>
#include <vector>

#include "semver/version/version.hpp"

namespace semver::test {

/**
 * Converts error to string.
 *
 * @param error
 * @return std::string
 */
std::string ErrorToStr(const Error& error);

/**
 * Converts versions to their canonical texts.
 *
 * @param versions versions.
 * @return std::vector<std::string>
 */
std::vector<std::string> VersionsToStrs(const Array<Version>& versions);

} // namespace semver::test

#endif
