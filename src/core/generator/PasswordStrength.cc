// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

#include "PasswordStrength.h"
#include "CommonPasswords.h"
#include <algorithm>
#include <cctype>

namespace SuperLocker::PasswordStrength {

int score(const Glib::ustring& password) {
    const std::string& raw = password.raw();

    bool has_upper = false;
    bool has_lower = false;
    bool has_digit = false;
    bool has_symbol = false;
    for (unsigned char c : raw) {
        if (std::isupper(c)) {
            has_upper = true;
        } else if (std::islower(c)) {
            has_lower = true;
        } else if (std::isdigit(c)) {
            has_digit = true;
        } else if (std::ispunct(c)) {
            has_symbol = true;
        }
    }

    int result = 0;
    if (password.length() >= 8) ++result;
    if (password.length() >= 12) ++result;
    if (has_upper && has_lower) ++result;
    if (has_digit) ++result;
    if (has_symbol) ++result;

    if (password.lowercase().raw().find("password") != std::string::npos) result -= 2;
    if (raw.find("123") != std::string::npos) result -= 1;
    if (raw.find("abc") != std::string::npos) result -= 1;
    if (is_common_password(raw)) result -= 1;

    return std::clamp(result, 0, MAX_SCORE);
}

std::string_view describe(int score) noexcept {
    switch (score) {
        case 2: return "Weak";
        case 3: return "Good";
        case 4: return "Strong";
        default: return "Very Weak";
    }
}

} // namespace SuperLocker::PasswordStrength
