/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef SEMVER_PARSER_HPP_
#define SEMVER_PARSER_HPP_

#include "semver/version/version.hpp"

namespace semver {

/**
 * Parses semantic version text.
 *
 * Text is accepted only if it fully matches the grammar:
 *   version    := core ["-" prerelease] ["+" build]
 *   core       := numeric "." numeric "." numeric
 *   numeric    := "0" | [1-9][0-9]*
 *   prerelease := pre-id ("." pre-id)*, pre-id := numeric | [0-9A-Za-z-]* with at least one non-digit
 *   build      := build-id ("." build-id)*, build-id := [0-9A-Za-z-]+
 * No trimming or case folding is performed.
 *
 * @param text version text.
 * @return RetWithError<Version, ParseError>.
 */
RetWithError<Version, ParseError> ParseVersion(const String& text);

} // namespace semver

#endif
