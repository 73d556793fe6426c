// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

#include <gtest/gtest.h>
#include "../src/core/generator/CommonPasswords.h"
#include "../src/core/generator/PasswordStrength.h"

using namespace SuperLocker;

TEST(PasswordStrengthTest, EmptyIsZero) {
    EXPECT_EQ(PasswordStrength::score(""), 0);
}

TEST(PasswordStrengthTest, EachCriterionAddsOnePoint) {
    EXPECT_EQ(PasswordStrength::score("zzzz"), 0);
    EXPECT_EQ(PasswordStrength::score("zzzzzzzz"), 1);         // length >= 8
    EXPECT_EQ(PasswordStrength::score("zzzzzzzzzzzz"), 2);     // length >= 12
    EXPECT_EQ(PasswordStrength::score("Zzzz"), 1);             // mixed case
    EXPECT_EQ(PasswordStrength::score("zz9z"), 1);             // digit
    EXPECT_EQ(PasswordStrength::score("zz#z"), 1);             // symbol
}

TEST(PasswordStrengthTest, StrongPasswordCapsAtFour) {
    EXPECT_EQ(PasswordStrength::score("Tr0ub4dor&3-xyzzy"), PasswordStrength::MAX_SCORE);
}

TEST(PasswordStrengthTest, LengthCountsCharactersNotBytes) {
    // Eight characters, sixteen bytes
    EXPECT_EQ(PasswordStrength::score("ääääääää"), 1);
    EXPECT_EQ(PasswordStrength::score("äääää"), 0);
}

TEST(PasswordStrengthTest, PatternPenalties) {
    // Length 12 (+2), mixed case (+1), digit (+1), "Password" (-2)
    EXPECT_EQ(PasswordStrength::score("MyPassword77"), 2);
    // Length 8 (+1), digit (+1), "123" (-1)
    EXPECT_EQ(PasswordStrength::score("zzzzz123"), 1);
    // Length 8 (+1), "abc" (-1)
    EXPECT_EQ(PasswordStrength::score("zzzzzabc"), 0);
}

TEST(PasswordStrengthTest, CommonPasswordsScoreLow) {
    EXPECT_EQ(PasswordStrength::score("password"), 0);
    EXPECT_EQ(PasswordStrength::score("qwerty"), 0);
    EXPECT_EQ(PasswordStrength::score("letmein"), 0);
    EXPECT_LE(PasswordStrength::score("Password1"), 1);
}

TEST(PasswordStrengthTest, NeverNegative) {
    EXPECT_EQ(PasswordStrength::score("password123abc"), 0);
}

TEST(PasswordStrengthTest, Descriptions) {
    EXPECT_EQ(PasswordStrength::describe(0), "Very Weak");
    EXPECT_EQ(PasswordStrength::describe(1), "Very Weak");
    EXPECT_EQ(PasswordStrength::describe(2), "Weak");
    EXPECT_EQ(PasswordStrength::describe(3), "Good");
    EXPECT_EQ(PasswordStrength::describe(4), "Strong");
}

TEST(CommonPasswordsTest, LookupIgnoresCase) {
    EXPECT_TRUE(is_common_password("password"));
    EXPECT_TRUE(is_common_password("PassWord"));
    EXPECT_TRUE(is_common_password("QWERTY"));
    EXPECT_FALSE(is_common_password("Tr0ub4dor&3-xyzzy"));
    EXPECT_FALSE(is_common_password(""));
}
