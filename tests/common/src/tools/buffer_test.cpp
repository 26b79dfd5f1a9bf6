/*
 * Copyright (C) 2023 Renesas Electronics Corporation.
 * Copyright (C) 2023 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cstring>

#include <gtest/gtest.h>

#include "semver/common/tools/buffer.hpp"

using namespace semver;

TEST(BufferTest, StaticBufferCopiesContent)
{
    constexpr auto cBufferSize = 64;

    StaticBuffer<cBufferSize> bufferA;
    StaticBuffer<cBufferSize> bufferB;

    EXPECT_EQ(bufferA.Size(), cBufferSize);
    EXPECT_NE(bufferA.Get(), bufferB.Get());

    strcpy(static_cast<char*>(bufferB.Get()), "1.0.0-rc.1");

    bufferA = bufferB;

    EXPECT_STREQ(static_cast<char*>(bufferA.Get()), "1.0.0-rc.1");

    StaticBuffer<cBufferSize> bufferC(bufferA);

    EXPECT_NE(bufferC.Get(), bufferA.Get());
    EXPECT_STREQ(static_cast<char*>(bufferC.Get()), "1.0.0-rc.1");
}

TEST(BufferTest, ExternalBuffer)
{
    char data[16] {};

    Buffer buffer(data, sizeof(data));

    EXPECT_EQ(buffer.Get(), data);
    EXPECT_EQ(buffer.Size(), sizeof(data));
}
