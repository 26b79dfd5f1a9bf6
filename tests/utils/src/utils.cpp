/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <string>

#include "semver/test/utils.hpp"

namespace semver::test {

std::string ErrorToStr(const Error& error)
{
    StaticString<cMaxErrorStrLen> errStr;

    if (auto err = errStr.Convert(error); !err.IsNone()) {
        return "can't convert error";
    }

    return std::string(errStr.CStr(), errStr.Size());
}

std::vector<std::string> VersionsToStrs(const Array<Version>& versions)
{
    std::vector<std::string> result;

    for (const auto& version : versions) {
        result.emplace_back(version.ToString().CStr());
    }

    return result;
}

} // namespace semver::test
