#pragma once

#include <latch/utility/base64.hpp>

#include <gtest/gtest.h>

namespace Latch::Tests
{
    class Base64Tests : public ::testing::Test
    {};

    TEST_F(Base64Tests, EncodesWithPadding)
    {
        EXPECT_EQ(base64Encode("user:password"), "dXNlcjpwYXNzd29yZA==");
        EXPECT_EQ(base64Encode("user@domain:password"), "dXNlckBkb21haW46cGFzc3dvcmQ=");
        EXPECT_EQ(base64Encode(""), "");
    }

    TEST_F(Base64Tests, DecodesCanonicalInput)
    {
        EXPECT_EQ(base64Decode("dXNlcjpwYXNzd29yZA=="), std::optional<std::string>{"user:password"});
        EXPECT_EQ(base64Decode("Zm8="), std::optional<std::string>{"fo"});
        EXPECT_EQ(base64Decode(""), std::optional<std::string>{""});
    }

    TEST_F(Base64Tests, RejectsMissingPadding)
    {
        EXPECT_FALSE(base64Decode("Zm8"));
        EXPECT_FALSE(base64Decode("Zg"));
    }

    TEST_F(Base64Tests, RejectsCharactersOutsideTheStandardAlphabet)
    {
        EXPECT_FALSE(base64Decode("Zm-_"));
        EXPECT_FALSE(base64Decode("!!!!"));
        EXPECT_FALSE(base64Decode("Zm8 "));
    }

    TEST_F(Base64Tests, RejectsMisplacedOrExcessPadding)
    {
        EXPECT_FALSE(base64Decode("Z=m8"));
        EXPECT_FALSE(base64Decode("Z==="));
        EXPECT_FALSE(base64Decode("===="));
    }

    TEST_F(Base64Tests, RejectsNonZeroTrailingBits)
    {
        EXPECT_FALSE(base64Decode("Zh=="));
        EXPECT_FALSE(base64Decode("Zm9="));
    }
}
