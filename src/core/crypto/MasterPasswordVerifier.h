// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

/**
 * @file MasterPasswordVerifier.h
 * @brief Quick master password check kept apart from the vault key
 *
 * Stores SHA-256(password ‖ VERIFIER_SALT) so a front end can reject a wrong
 * password before paying for the key derivation of a real unlock.
 *
 * @warning The salt is a fixed constant shared by every account and the hash
 *          is a single SHA-256 pass. The artifact is far weaker than the
 *          wrapped VaultKey and must never be used as key material.
 */

#pragma once

#include "../VaultError.h"
#include <glibmm/ustring.h>
#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace SuperLocker {

class MasterPasswordVerifier {
public:
    static constexpr size_t HASH_LENGTH = 32;
    static constexpr std::string_view VERIFIER_SALT = "SuperLocker.master-password-verifier.v1";

    using Hash = std::array<uint8_t, HASH_LENGTH>;

    /**
     * @brief Compute the verification hash
     * @return Digest, or KeyDerivationError if the digest context fails
     */
    [[nodiscard]] static VaultResult<Hash> compute(const Glib::ustring& password);

    /**
     * @brief Compare @p password against a stored hash in constant time
     * @return false on mismatch, on a stored value that is not HASH_LENGTH
     *         bytes, or if the hash cannot be computed
     */
    [[nodiscard]] static bool verify(const Glib::ustring& password,
                                     std::span<const uint8_t> stored);

    /** @brief verify() against a base64 stored value */
    [[nodiscard]] static bool verify_encoded(const Glib::ustring& password,
                                             std::string_view stored);

    [[nodiscard]] static std::string to_base64(const Hash& hash);
    [[nodiscard]] static VaultResult<Hash> from_base64(std::string_view encoded);
};

} // namespace SuperLocker
