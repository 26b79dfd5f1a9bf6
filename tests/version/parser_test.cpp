/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <string>

#include <gtest/gtest.h>

#include "semver/test/log.hpp"
#include "semver/test/utils.hpp"
#include "semver/version/parser.hpp"

namespace semver {

using namespace testing;

/***********************************************************************************************************************
 * Suite
 **********************************************************************************************************************/

class ParserTest : public Test {
protected:
    void SetUp() override { test::InitLog(); }
};

/***********************************************************************************************************************
 * Tests
 **********************************************************************************************************************/

TEST_F(ParserTest, ParseComponents)
{
    auto [version, err] = ParseVersion("1.2.3-alpha.1+build.005");
    ASSERT_TRUE(err.IsNone()) << test::ErrorToStr(err);

    LOG_DBG() << "Parsed version: " << version;

    EXPECT_EQ(version.Major(), 1);
    EXPECT_EQ(version.Minor(), 2);
    EXPECT_EQ(version.Patch(), 3);

    ASSERT_EQ(version.Prerelease().Size(), 2);
    EXPECT_EQ(version.Prerelease()[0], "alpha");
    EXPECT_EQ(version.Prerelease()[1], "1");

    ASSERT_EQ(version.Build().Size(), 2);
    EXPECT_EQ(version.Build()[0], "build");
    EXPECT_EQ(version.Build()[1], "005");

    EXPECT_TRUE(version.IsPrerelease());
    EXPECT_TRUE(version.HasBuild());
}

TEST_F(ParserTest, ParseRelease)
{
    auto [version, err] = ParseVersion("0.0.0");
    ASSERT_TRUE(err.IsNone()) << test::ErrorToStr(err);

    EXPECT_EQ(version, Version(0, 0, 0));
    EXPECT_FALSE(version.IsPrerelease());
    EXPECT_FALSE(version.HasBuild());
}

TEST_F(ParserTest, RoundTrip)
{
    const char* versions[] = {
        "0.0.4",
        "1.2.3",
        "10.20.30",
        "1.1.2-prerelease+meta",
        "1.1.2+meta",
        "1.1.2+meta-valid",
        "1.0.0-alpha",
        "1.0.0-beta",
        "1.0.0-alpha.beta",
        "1.0.0-alpha.beta.1",
        "1.0.0-alpha.1",
        "1.0.0-alpha0.valid",
        "1.0.0-alpha.0valid",
        "1.0.0-alpha-a.b-c-somethinglong+build.1-aef.1-its-okay",
        "1.0.0-rc.1+build.1",
        "2.0.0-rc.1+build.123",
        "1.2.3-beta",
        "10.2.3-DEV-SNAPSHOT",
        "1.2.3-SNAPSHOT-123",
        "2.0.0+build.1848",
        "2.0.1-alpha.1227",
        "1.0.0-alpha+beta",
        "1.2.3----RC-SNAPSHOT.12.9.1--.12+788",
        "1.2.3----R-S.12.9.1--.12+meta",
        "1.2.3----RC-SNAPSHOT.12.9.1--.12",
        "1.0.0+0.build.1-rc.10000aaa-kk-0.1",
        "1.0.0-0A.is.legal",
        "1.0.0--",
        "1.0.0-0",
        "18446744073709551615.18446744073709551615.18446744073709551615",
    };

    for (const auto text : versions) {
        auto [version, err] = ParseVersion(text);

        ASSERT_TRUE(err.IsNone()) << "version: " << text << ", err: " << test::ErrorToStr(err);
        EXPECT_EQ(version.ToString(), text);

        auto reparsed = ParseVersion(version.ToString());

        ASSERT_TRUE(reparsed.mError.IsNone());
        EXPECT_EQ(reparsed.mValue, version) << "version: " << text;
    }
}

TEST_F(ParserTest, InvalidVersions)
{
    struct TestData {
        const char* mVersion;
        ErrorEnum   mErr;
    };

    const TestData testData[] = {
        {"", ErrorEnum::eInvalidArgument},
        {"1", ErrorEnum::eInvalidArgument},
        {"1.2", ErrorEnum::eInvalidArgument},
        {"1.0", ErrorEnum::eInvalidArgument},
        {"1.2.3.4", ErrorEnum::eInvalidArgument},
        {"1.01.0", ErrorEnum::eInvalidArgument},
        {"01.1.1", ErrorEnum::eInvalidArgument},
        {"1.1.01", ErrorEnum::eInvalidArgument},
        {"1..1", ErrorEnum::eInvalidArgument},
        {"1.1.", ErrorEnum::eInvalidArgument},
        {".1.1", ErrorEnum::eInvalidArgument},
        {"1.0.0-", ErrorEnum::eInvalidArgument},
        {"1.0.0+", ErrorEnum::eInvalidArgument},
        {"1.0.0-+build", ErrorEnum::eInvalidArgument},
        {"1.2.3-0123", ErrorEnum::eInvalidArgument},
        {"1.2.3-0123.0123", ErrorEnum::eInvalidArgument},
        {"1.0.0-alpha..1", ErrorEnum::eInvalidArgument},
        {"1.0.0-alpha.", ErrorEnum::eInvalidArgument},
        {"1.0.0-alpha_beta", ErrorEnum::eInvalidArgument},
        {"1.0.0+build+1", ErrorEnum::eInvalidArgument},
        {"1.0.0+build..1", ErrorEnum::eInvalidArgument},
        {"1.2.3.DEV", ErrorEnum::eInvalidArgument},
        {"1.2-SNAPSHOT", ErrorEnum::eInvalidArgument},
        {"-1.0.0", ErrorEnum::eInvalidArgument},
        {"+justmeta", ErrorEnum::eInvalidArgument},
        {"v1.0.0", ErrorEnum::eInvalidArgument},
        {"V1.0.0", ErrorEnum::eInvalidArgument},
        {" 1.0.0", ErrorEnum::eInvalidArgument},
        {"1.0.0 ", ErrorEnum::eInvalidArgument},
        {"1.0.0\n", ErrorEnum::eInvalidArgument},
        {"1.0.0-be\xc3\x9fta", ErrorEnum::eInvalidArgument},
        {"1.a.0", ErrorEnum::eInvalidArgument},
        {"18446744073709551616.0.0", ErrorEnum::eOutOfRange},
        {"1.0.99999999999999999999", ErrorEnum::eOutOfRange},
    };

    for (const auto& data : testData) {
        auto [version, err] = ParseVersion(data.mVersion);

        EXPECT_TRUE(err.Is(data.mErr)) << "version: " << data.mVersion << ", err: " << test::ErrorToStr(err);
        EXPECT_EQ(version, Version()) << "version: " << data.mVersion;
    }
}

TEST_F(ParserTest, ErrorLocation)
{
    struct TestData {
        const char* mVersion;
        size_t      mPosition;
        const char* mFragment;
    };

    const TestData testData[] = {
        {"1.01.0", 2, "01"},
        {"1.0", 3, "1.0"},
        {"1.0.0.0", 5, "1.0.0.0"},
        {"1.0.0-", 5, "-"},
        {"1.0.0+", 5, "+"},
        {"1.0.0-alpha..1", 12, ""},
        {"1.0.0-alpha_1", 11, "alpha_1"},
        {"1.0.0-rc.01", 9, "01"},
        {"1.0.0-rc+b.c!", 12, "c!"},
    };

    for (const auto& data : testData) {
        auto err = ParseVersion(data.mVersion).mError;

        LOG_DBG() << "Parse error: " << err;

        ASSERT_FALSE(err.IsNone()) << "version: " << data.mVersion;
        EXPECT_EQ(err.Position(), data.mPosition) << "version: " << data.mVersion;
        EXPECT_EQ(err.Fragment(), data.mFragment) << "version: " << data.mVersion;
    }
}

TEST_F(ParserTest, CapacityLimits)
{
    std::string identifiers = "a";

    for (size_t i = 1; i < cMaxNumIdentifiers; i++) {
        identifiers += ".a";
    }

    EXPECT_TRUE(ParseVersion(("1.0.0-" + identifiers).c_str()).mError.IsNone());
    EXPECT_TRUE(ParseVersion(("1.0.0-" + identifiers + ".a").c_str()).mError.Is(ErrorEnum::eNoMemory));
    EXPECT_TRUE(ParseVersion(("1.0.0+" + identifiers).c_str()).mError.IsNone());
    EXPECT_TRUE(ParseVersion(("1.0.0+" + identifiers + ".a").c_str()).mError.Is(ErrorEnum::eNoMemory));

    std::string longIdentifier(cIdentifierLen, 'x');

    EXPECT_TRUE(ParseVersion(("1.0.0-" + longIdentifier).c_str()).mError.IsNone());
    EXPECT_TRUE(ParseVersion(("1.0.0-" + longIdentifier + "x").c_str()).mError.Is(ErrorEnum::eNoMemory));

    std::string longVersion = "1.0.0";

    while (longVersion.size() <= cVersionLen) {
        longVersion += "0";
    }

    EXPECT_TRUE(ParseVersion(longVersion.c_str()).mError.Is(ErrorEnum::eNoMemory));
}

} // namespace semver
