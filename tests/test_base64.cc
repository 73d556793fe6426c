// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

#include <gtest/gtest.h>
#include "../src/utils/Base64.h"

using namespace SuperLocker;

namespace {

std::vector<uint8_t> bytes_of(std::string_view text) {
    return {text.begin(), text.end()};
}

} // namespace

TEST(Base64Test, EncodesKnownVectors) {
    EXPECT_EQ(Base64::encode(bytes_of("")), "");
    EXPECT_EQ(Base64::encode(bytes_of("f")), "Zg==");
    EXPECT_EQ(Base64::encode(bytes_of("fo")), "Zm8=");
    EXPECT_EQ(Base64::encode(bytes_of("foo")), "Zm9v");
    EXPECT_EQ(Base64::encode(bytes_of("foobar")), "Zm9vYmFy");
}

TEST(Base64Test, DecodesKnownVectors) {
    auto one_pad = Base64::decode("Zm8=");
    ASSERT_TRUE(one_pad.has_value());
    EXPECT_EQ(*one_pad, bytes_of("fo"));

    auto two_pad = Base64::decode("Zg==");
    ASSERT_TRUE(two_pad.has_value());
    EXPECT_EQ(*two_pad, bytes_of("f"));

    auto no_pad = Base64::decode("Zm9vYmFy");
    ASSERT_TRUE(no_pad.has_value());
    EXPECT_EQ(*no_pad, bytes_of("foobar"));
}

TEST(Base64Test, EmptyInputDecodesToEmpty) {
    auto result = Base64::decode("");
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->empty());
}

TEST(Base64Test, BinaryDataSurvivesEncoding) {
    std::vector<uint8_t> data(256);
    for (size_t i = 0; i < data.size(); ++i) {
        data[i] = static_cast<uint8_t>(i);
    }

    auto decoded = Base64::decode(Base64::encode(data));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, data);
}

// ============================================================================
// Malformed input
// ============================================================================

TEST(Base64Test, RejectsLengthNotMultipleOfFour) {
    auto result = Base64::decode("Zm9");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), VaultError::InvalidFormat);
}

TEST(Base64Test, RejectsCharactersOutsideAlphabet) {
    EXPECT_FALSE(Base64::decode("Zm9!").has_value());
    EXPECT_FALSE(Base64::decode("Zm 9").has_value());
    EXPECT_FALSE(Base64::decode("Zm-_").has_value());
}

TEST(Base64Test, RejectsPaddingInsideData) {
    EXPECT_FALSE(Base64::decode("Z=9v").has_value());
    EXPECT_FALSE(Base64::decode("Zm==Zm9v").has_value());
}
