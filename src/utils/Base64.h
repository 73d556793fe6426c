// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

/**
 * @file Base64.h
 * @brief Standard (RFC 4648, padded) base64 used for every persisted byte field
 */

#ifndef SUPERLOCKER_BASE64_H
#define SUPERLOCKER_BASE64_H

#include "../core/VaultError.h"
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace SuperLocker::Base64 {

/**
 * @brief Encode bytes as padded base64 without line breaks
 */
[[nodiscard]] std::string encode(std::span<const uint8_t> data);

/**
 * @brief Strictly decode padded base64
 *
 * Rejects whitespace, characters outside the alphabet, misplaced padding
 * and lengths that are not a multiple of four.
 *
 * @return Decoded bytes, or VaultError::InvalidFormat
 */
[[nodiscard]] VaultResult<std::vector<uint8_t>> decode(std::string_view text);

} // namespace SuperLocker::Base64

#endif // SUPERLOCKER_BASE64_H
