/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include "semver/common/tools/error.hpp"

using namespace semver;

namespace {

RetWithError<int> Divide(int value, int divider)
{
    if (divider == 0) {
        return {0, Error(ErrorEnum::eInvalidArgument, "division by zero")};
    }

    return value / divider;
}

} // namespace

TEST(ErrorTest, Basic)
{
    Error err;

    EXPECT_TRUE(err.IsNone());
    EXPECT_STREQ(err.Message(), "none");

    err = Error(ErrorEnum::eNoMemory);

    EXPECT_TRUE(err.Is(ErrorEnum::eNoMemory));
    EXPECT_EQ(err, ErrorEnum::eNoMemory);
    EXPECT_STREQ(err.Message(), "not enough memory");

    err = Error(err, "version too long");

    EXPECT_TRUE(err.Is(ErrorEnum::eNoMemory));
    EXPECT_STREQ(err.Message(), "version too long");
}

TEST(ErrorTest, Wrap)
{
    auto err = SEMVER_ERROR_WRAP(Error(ErrorEnum::eOutOfRange, "overflow"));

    EXPECT_TRUE(err.Is(ErrorEnum::eOutOfRange));
    EXPECT_STREQ(err.Message(), "overflow");
    EXPECT_NE(err.FileName(), nullptr);
    EXPECT_GT(err.LineNumber(), 0);
}

TEST(ErrorTest, Tie)
{
    int   value = -1;
    Error err;

    Tie(value, err) = Divide(10, 2);

    EXPECT_TRUE(err.IsNone());
    EXPECT_EQ(value, 5);

    Tie(value, err) = Divide(10, 0);

    EXPECT_TRUE(err.Is(ErrorEnum::eInvalidArgument));
    EXPECT_EQ(value, 0);
}
