/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef SEMVER_CONFIG_HPP_
#define SEMVER_CONFIG_HPP_

/**
 * Optional user configuration.
 */
#ifdef __has_include
#if __has_include("semverconfig.hpp")
#include "semverconfig.hpp"
#endif
#endif

/**
 * Max length of version canonical text.
 */
#ifndef SEMVER_CONFIG_VERSION_LEN
#define SEMVER_CONFIG_VERSION_LEN 256
#endif

/**
 * Max length of prerelease or build identifier.
 */
#ifndef SEMVER_CONFIG_IDENTIFIER_LEN
#define SEMVER_CONFIG_IDENTIFIER_LEN 64
#endif

/**
 * Max number of prerelease or build identifiers.
 */
#ifndef SEMVER_CONFIG_MAX_NUM_IDENTIFIERS
#define SEMVER_CONFIG_MAX_NUM_IDENTIFIERS 16
#endif

/**
 * Log line length.
 */
#ifndef SEMVER_CONFIG_LOG_LINE_LEN
#define SEMVER_CONFIG_LOG_LINE_LEN 256
#endif

#endif
