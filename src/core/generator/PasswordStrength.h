// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

#pragma once

#include <glibmm/ustring.h>
#include <string_view>

namespace SuperLocker::PasswordStrength {

inline constexpr int MAX_SCORE = 4;

/**
 * @brief Heuristic strength score in [0, MAX_SCORE]
 *
 * One point each for length >= 8, length >= 12 (in characters), mixed case,
 * a digit and a symbol. Two points off for "password" anywhere (any case),
 * one for "123", one for "abc" and one for a blacklisted password.
 */
[[nodiscard]] int score(const Glib::ustring& password);

/**
 * @brief Label for a score: "Very Weak" (0-1), "Weak", "Good", "Strong"
 */
[[nodiscard]] std::string_view describe(int score) noexcept;

} // namespace SuperLocker::PasswordStrength
