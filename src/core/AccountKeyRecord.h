// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

/**
 * @file AccountKeyRecord.h
 * @brief Persisted per-account key material and stored secret records
 *
 * Everything here is safe to persist: the salt is public, the vault key is
 * present only in wrapped form, and secret records hold ciphertext blobs.
 */

#ifndef SUPERLOCKER_ACCOUNT_KEY_RECORD_H
#define SUPERLOCKER_ACCOUNT_KEY_RECORD_H

#include "VaultError.h"
#include "crypto/KeyDerivation.h"
#include <array>
#include <cstdint>
#include <ctime>
#include <map>
#include <string>
#include <vector>

namespace SuperLocker {

/**
 * @brief Flat string document as exchanged with the external document store
 */
using Document = std::map<std::string, std::string>;

/**
 * @brief Wrapped vault key plus everything needed to re-derive its MasterKey
 *
 * Document layout (all byte fields base64):
 * @code
 * { "salt": <32 bytes>, "vaultKeyIV": <16 bytes>, "encryptedVaultKey": <ciphertext>,
 *   "kdf": "pbkdf2" | "argon2id", "iterations": "<decimal>",
 *   "argon2MemoryKb": "<decimal>", "argon2Parallelism": "<decimal>" }
 * @endcode
 * The KDF fields are optional on read; records that predate them are
 * PBKDF2 with 100,000 iterations.
 *
 * @note The salt is generated once per account and must never be replaced
 *       except by VaultKeyManager::change_master_secret(), which re-wraps.
 */
struct AccountKeyRecord {
    static constexpr size_t SALT_LENGTH = 32;
    static constexpr size_t IV_LENGTH = 16;

    std::array<uint8_t, SALT_LENGTH> salt{};
    std::array<uint8_t, IV_LENGTH> vault_key_iv{};
    std::vector<uint8_t> encrypted_vault_key;

    KdfAlgorithm kdf_algorithm = KdfAlgorithm::PBKDF2_HMAC_SHA256;
    uint32_t iterations = Pbkdf2KeyDerivation::DEFAULT_ITERATIONS;  ///< PBKDF2 iterations or Argon2 passes
    uint32_t argon2_memory_kb = 0;
    uint32_t argon2_parallelism = 0;

    /** @brief Parameters to rebuild the derivation that produced the MasterKey */
    [[nodiscard]] KdfParameters kdf_parameters() const;

    [[nodiscard]] Document to_document() const;

    /**
     * @brief Parse a stored document
     * @return Record, or VaultError::InvalidFormat for missing, undecodable or
     *         wrongly sized fields and unknown KDF names
     */
    [[nodiscard]] static VaultResult<AccountKeyRecord> from_document(const Document& doc);
};

/**
 * @brief One stored user secret (a saved password entry)
 *
 * Only encrypted_secret matters to the core; the metadata travels along so
 * callers can update timestamps when a blob is re-encoded.
 */
struct SecretRecord {
    std::string id;
    std::string encrypted_secret;   ///< base64 CiphertextBlob
    std::time_t created_at = 0;
    std::time_t updated_at = 0;
    std::string site;
    std::string username;
};

} // namespace SuperLocker

#endif // SUPERLOCKER_ACCOUNT_KEY_RECORD_H
