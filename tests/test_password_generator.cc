// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

/**
 * @file test_password_generator.cc
 * @brief Tests for random password generation
 */

#include <gtest/gtest.h>
#include "../src/core/generator/PasswordGenerator.h"
#include <algorithm>
#include <set>

using namespace SuperLocker;

namespace {

class FailingRandomSource final : public IRandomSource {
public:
    VaultResult<void> fill(std::span<uint8_t>) override {
        return std::unexpected(VaultError::RandomGenerationFailed);
    }
};

bool only_from(const std::string& text, std::string_view pool) {
    return std::all_of(text.begin(), text.end(),
                       [&](char c) { return pool.find(c) != std::string_view::npos; });
}

} // namespace

class PasswordGeneratorTest : public ::testing::Test {
protected:
    PasswordGenerator generator;
};

TEST_F(PasswordGeneratorTest, LowerAndDigitsOnly) {
    CharacterClasses classes;
    classes.upper = false;
    classes.symbols = false;

    for (int i = 0; i < 100; ++i) {
        auto password = generator.generate(16, classes);
        ASSERT_TRUE(password.has_value());
        ASSERT_EQ(password->size(), 16u);
        EXPECT_TRUE(only_from(*password, "abcdefghijklmnopqrstuvwxyz0123456789")) << *password;
    }
}

TEST_F(PasswordGeneratorTest, DefaultClassesCoverWholePool) {
    // 200 x 32 draws from 88 characters: every character shows up
    const std::string pool = PasswordGenerator::build_pool(CharacterClasses{});
    std::set<char> seen;
    for (int i = 0; i < 200; ++i) {
        auto password = generator.generate(32, CharacterClasses{});
        ASSERT_TRUE(password.has_value());
        EXPECT_TRUE(only_from(*password, pool));
        seen.insert(password->begin(), password->end());
    }
    EXPECT_EQ(seen.size(), pool.size());
}

TEST_F(PasswordGeneratorTest, ExcludeSimilarDropsLookAlikes) {
    CharacterClasses classes;
    classes.exclude_similar = true;

    const std::string pool = PasswordGenerator::build_pool(classes);
    for (char c : std::string_view("il1Lo0O")) {
        EXPECT_EQ(pool.find(c), std::string::npos) << c;
    }
    EXPECT_NE(pool.find('I'), std::string::npos);

    for (int i = 0; i < 50; ++i) {
        auto password = generator.generate(64, classes);
        ASSERT_TRUE(password.has_value());
        EXPECT_EQ(password->find_first_of("il1Lo0O"), std::string::npos) << *password;
    }
}

TEST_F(PasswordGeneratorTest, SymbolsOnly) {
    CharacterClasses classes{false, false, false, true, false};
    auto password = generator.generate(40, classes);
    ASSERT_TRUE(password.has_value());
    EXPECT_TRUE(only_from(*password, PasswordGenerator::SYMBOLS));
}

TEST_F(PasswordGeneratorTest, OutputsDiffer) {
    auto first = generator.generate(20, CharacterClasses{});
    auto second = generator.generate(20, CharacterClasses{});
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_NE(*first, *second);
}

// ============================================================================
// Errors
// ============================================================================

TEST_F(PasswordGeneratorTest, NoClassesSelected) {
    CharacterClasses none{false, false, false, false, false};
    auto password = generator.generate(16, none);
    ASSERT_FALSE(password.has_value());
    EXPECT_EQ(password.error(), VaultError::NoCharacterClasses);
}

TEST_F(PasswordGeneratorTest, ZeroLength) {
    auto password = generator.generate(0, CharacterClasses{});
    ASSERT_FALSE(password.has_value());
    EXPECT_EQ(password.error(), VaultError::InvalidLength);
}

TEST_F(PasswordGeneratorTest, RandomFailurePropagates) {
    FailingRandomSource failing;
    PasswordGenerator broken(failing);
    auto password = broken.generate(8, CharacterClasses{});
    ASSERT_FALSE(password.has_value());
    EXPECT_EQ(password.error(), VaultError::RandomGenerationFailed);
}
