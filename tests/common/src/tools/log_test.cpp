/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "semver/common/tools/log.hpp"

using namespace semver;

namespace {

struct LogLine {
    std::string  mModule;
    LogLevelEnum mLevel;
    std::string  mMessage;
};

std::vector<LogLine> sLogLines;

void StoreLog(const char* module, LogLevel level, const String& message)
{
    sLogLines.push_back({module, level.GetValue(), message.CStr()});
}

} // namespace

/***********************************************************************************************************************
 * Suite
 **********************************************************************************************************************/

class LogTest : public testing::Test {
protected:
    void SetUp() override
    {
        sLogLines.clear();
        Log::SetCallback(StoreLog);
    }

    void TearDown() override { Log::SetCallback(nullptr); }
};

/***********************************************************************************************************************
 * Tests
 **********************************************************************************************************************/

TEST_F(LogTest, Levels)
{
    LOG_MODULE_DBG("mod") << "debug";
    LOG_MODULE_INF("mod") << "info";
    LOG_MODULE_WRN("mod") << "warning";
    LOG_MODULE_ERR("other") << "error";

    ASSERT_EQ(sLogLines.size(), 4);

    EXPECT_EQ(sLogLines[0].mLevel, LogLevelEnum::eDebug);
    EXPECT_EQ(sLogLines[1].mLevel, LogLevelEnum::eInfo);
    EXPECT_EQ(sLogLines[2].mLevel, LogLevelEnum::eWarning);
    EXPECT_EQ(sLogLines[3].mLevel, LogLevelEnum::eError);
    EXPECT_EQ(sLogLines[3].mModule, "other");
    EXPECT_EQ(sLogLines[3].mMessage, "error");

    EXPECT_STREQ(LogLevel(LogLevelEnum::eWarning).ToString(), "warning");
}

TEST_F(LogTest, Values)
{
    LOG_MODULE_DBG("mod") << "int: " << -42 << ", max: " << UINT64_MAX << ", min: " << INT64_MIN;
    LOG_MODULE_DBG("mod") << "err: " << Error(ErrorEnum::eOutOfRange);
    LOG_MODULE_DBG("mod") << "level: " << LogLevel(LogLevelEnum::eError);

    ASSERT_EQ(sLogLines.size(), 3);

    EXPECT_EQ(sLogLines[0].mMessage, "int: -42, max: 18446744073709551615, min: -9223372036854775808");
    EXPECT_EQ(sLogLines[1].mMessage, "err: out of range");
    EXPECT_EQ(sLogLines[2].mMessage, "level: error");
}

TEST_F(LogTest, LongLineIsTruncated)
{
    std::string longStr(cLogLineLen * 2, 'x');

    LOG_MODULE_INF("mod") << longStr.c_str() << "tail";

    ASSERT_EQ(sLogLines.size(), 1);
    EXPECT_EQ(sLogLines[0].mMessage, std::string(cLogLineLen, 'x'));
}

TEST_F(LogTest, NoCallback)
{
    Log::SetCallback(nullptr);

    LOG_MODULE_ERR("mod") << "dropped";

    EXPECT_TRUE(sLogLines.empty());
}
