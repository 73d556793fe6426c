// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

/**
 * @file CommonPasswords.h
 * @brief Short blacklist of passwords that top public breach rankings
 *
 * Entries are lowercase; compare case-insensitively.
 */

#ifndef SUPERLOCKER_COMMON_PASSWORDS_H
#define SUPERLOCKER_COMMON_PASSWORDS_H

#include <algorithm>
#include <array>
#include <cctype>
#include <string>
#include <string_view>

namespace SuperLocker {

inline constexpr std::array<std::string_view, 64> COMMON_PASSWORDS = {
    // Numeric runs
    "123456", "12345678", "123456789", "1234567890", "1234567", "12345",
    "111111", "000000", "123123", "654321", "666666", "121212",
    "987654321", "112233", "159753", "7777777",
    // Keyboard walks
    "qwerty", "qwertyuiop", "qwerty123", "1q2w3e4r", "1qaz2wsx", "asdfghjkl",
    "zxcvbnm", "asdf1234", "qazwsx", "q1w2e3r4t5",
    // Words
    "password", "password1", "password123", "passw0rd", "p@ssw0rd", "letmein",
    "welcome", "welcome1", "admin", "administrator", "login", "secret",
    "master", "iloveyou", "monkey", "dragon", "football", "baseball",
    "sunshine", "princess", "shadow", "superman", "trustno1", "whatever",
    "starwars", "freedom", "michael", "charlie", "jennifer", "hunter2",
    "changeme", "default", "access", "abc123", "abcdef", "pokemon",
    "mustang", "computer"
};

/**
 * @brief Case-insensitive blacklist lookup
 */
[[nodiscard]] inline bool is_common_password(std::string_view password) {
    std::string lower(password);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    return std::find(COMMON_PASSWORDS.begin(), COMMON_PASSWORDS.end(), lower)
           != COMMON_PASSWORDS.end();
}

} // namespace SuperLocker

#endif // SUPERLOCKER_COMMON_PASSWORDS_H
