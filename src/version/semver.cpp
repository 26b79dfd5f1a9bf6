/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "semver/version/semver.hpp"

#include "log.hpp"

namespace semver {

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

Error ValidateSemver(const String& version)
{
    auto result = ParseVersion(version);
    if (!result.mError.IsNone()) {
        LOG_DBG() << "Invalid version: version=" << version << ", err=" << result.mError;

        return result.mError;
    }

    return ErrorEnum::eNone;
}

RetWithError<int> CompareSemver(const String& version1, const String& version2)
{
    Version    parsed1, parsed2;
    ParseError err;

    Tie(parsed1, err) = ParseVersion(version1);
    if (!err.IsNone()) {
        LOG_DBG() << "Can't compare versions: version=" << version1 << ", err=" << err;

        return {0, SEMVER_ERROR_WRAP(err)};
    }

    Tie(parsed2, err) = ParseVersion(version2);
    if (!err.IsNone()) {
        LOG_DBG() << "Can't compare versions: version=" << version2 << ", err=" << err;

        return {0, SEMVER_ERROR_WRAP(err)};
    }

    switch (Compare(parsed1, parsed2).GetValue()) {
    case OrderingEnum::eLess:
        return -1;

    case OrderingEnum::eGreater:
        return 1;

    default:
        return 0;
    }
}

} // namespace semver
