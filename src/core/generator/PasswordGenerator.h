// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

#pragma once

#include "../VaultError.h"
#include "../crypto/RandomSource.h"
#include <string>
#include <string_view>

namespace SuperLocker {

/**
 * @brief Character classes a generated password may draw from
 */
struct CharacterClasses {
    bool upper = true;
    bool lower = true;
    bool digits = true;
    bool symbols = true;
    bool exclude_similar = false;  ///< Drop look-alikes (i, l, o, I, L, O, 0, 1)
};

/**
 * @class PasswordGenerator
 * @brief Uniformly random passwords over a configurable pool
 *
 * The pool is the concatenation of the enabled classes. Every character is
 * picked with IRandomSource::uniform_index(), so there is no modulo bias.
 */
class PasswordGenerator {
public:
    static constexpr size_t DEFAULT_LENGTH = 16;

    static constexpr std::string_view UPPER = "ABCDEFGHIJKLMNOPQRSTUVWXYZ";
    static constexpr std::string_view UPPER_UNAMBIGUOUS = "ABCDEFGHIJKMNPQRSTUVWXYZ";
    static constexpr std::string_view LOWER = "abcdefghijklmnopqrstuvwxyz";
    static constexpr std::string_view LOWER_UNAMBIGUOUS = "abcdefghjkmnpqrstuvwxyz";
    static constexpr std::string_view DIGITS = "0123456789";
    static constexpr std::string_view DIGITS_UNAMBIGUOUS = "23456789";
    static constexpr std::string_view SYMBOLS = "!@#$%^&*()-_=+[]{}|;:,.<>?";

    explicit PasswordGenerator(IRandomSource& random = OpenSslRandomSource::instance())
        : m_random(random) {}

    /**
     * @brief Generate one password
     * @return Password, or InvalidLength (length 0), NoCharacterClasses
     *         (nothing enabled) or RandomGenerationFailed
     */
    [[nodiscard]] VaultResult<std::string> generate(size_t length,
                                                    const CharacterClasses& classes) const;

    /** @brief Characters generate() would draw from */
    [[nodiscard]] static std::string build_pool(const CharacterClasses& classes);

private:
    IRandomSource& m_random;
};

} // namespace SuperLocker
