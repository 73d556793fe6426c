// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

/**
 * @file SecretCodec.h
 * @brief Encoding of one stored secret to and from its ciphertext blob
 *
 * Blobs are base64 text. Three byte layouts exist in stored data:
 *
 * | Layout          | Bytes                                   | Key needed      |
 * |-----------------|-----------------------------------------|-----------------|
 * | Current         | 0x02 ‖ iv(16) ‖ ciphertext              | VaultKey        |
 * | UntaggedCurrent | iv(16) ‖ ciphertext                     | VaultKey        |
 * | Legacy          | salt(32) ‖ iv(16) ‖ ciphertext          | master password |
 *
 * All new writes use the tagged Current layout. A tagged blob is always
 * 1 (mod 16) bytes long, which no untagged layout can be, so the tag never
 * collides with older data.
 *
 * Untagged data carries no version marker and is classified by length
 * alone: 64 bytes or more is Legacy, 32 or 48 bytes is UntaggedCurrent.
 * An untagged current blob of 64 bytes or more (a plaintext of 32+ bytes)
 * is therefore reported as Legacy; migration will fail to decode it and
 * leave it untouched.
 */

#pragma once

#include "../VaultError.h"
#include "../VaultKey.h"
#include "../crypto/KeyDerivation.h"
#include "../crypto/RandomSource.h"
#include "../crypto/SymmetricCipher.h"
#include "../../utils/SecureMemory.h"
#include <glibmm/ustring.h>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace SuperLocker {

enum class BlobFormat {
    Current,          ///< Tagged vault-key blob
    UntaggedCurrent,  ///< Vault-key blob written before format tags existed
    Legacy,           ///< Per-secret salt, master-password derived key
    Invalid           ///< Not base64, or a length no layout produces
};

[[nodiscard]] constexpr std::string_view to_string(BlobFormat format) noexcept {
    switch (format) {
        case BlobFormat::Current: return "current";
        case BlobFormat::UntaggedCurrent: return "untagged-current";
        case BlobFormat::Legacy: return "legacy";
        case BlobFormat::Invalid: return "invalid";
    }
    return "invalid";
}

class SecretCodec {
public:
    static constexpr uint8_t FORMAT_TAG_VAULT_KEY = 0x02;
    static constexpr size_t IV_LENGTH = AesCbcCipher::IV_LENGTH;
    static constexpr size_t LEGACY_SALT_LENGTH = 32;
    static constexpr size_t LEGACY_HEADER_LENGTH = LEGACY_SALT_LENGTH + IV_LENGTH;
    /** @brief Salt + IV + one cipher block */
    static constexpr size_t LEGACY_MIN_LENGTH = LEGACY_HEADER_LENGTH + AesCbcCipher::BLOCK_SIZE;

    /**
     * @param random Source for IVs and legacy salts (must outlive the codec)
     * @param cipher Cipher for both layouts (AES-256-CBC when null)
     * @param legacy_iterations PBKDF2 iterations of the legacy layout
     */
    explicit SecretCodec(
        IRandomSource& random = OpenSslRandomSource::instance(),
        std::shared_ptr<const ISymmetricCipher> cipher = nullptr,
        uint32_t legacy_iterations = Pbkdf2KeyDerivation::DEFAULT_ITERATIONS);

    /**
     * @brief Classify a stored blob by its tag or, if untagged, its length
     */
    [[nodiscard]] static BlobFormat detect_format(std::string_view blob);

    /**
     * @brief Best-effort check for the legacy layout
     *
     * Heuristic only; see the file comment for the ambiguous range.
     */
    [[nodiscard]] static bool is_legacy_format(std::string_view blob);

    /**
     * @brief Encrypt a secret under the VaultKey with a fresh IV
     * @return Tagged base64 blob, or RandomGenerationFailed / EncryptionFailed
     */
    [[nodiscard]] VaultResult<std::string> encode_current(
        const Glib::ustring& plaintext,
        const VaultKey& vault_key) const;

    /**
     * @brief Decrypt a tagged or untagged vault-key blob
     *
     * @return Plaintext; InvalidFormat for bad base64 or a payload shorter
     *         than the IV; DecryptionFailed for cipher failures or output that
     *         is not valid UTF-8
     */
    [[nodiscard]] VaultResult<SecureString> decode_current(
        std::string_view blob,
        const VaultKey& vault_key) const;

    /**
     * @brief Produce a legacy single-tier blob
     *
     * Runs the full key derivation for every call. Kept to read and test
     * historical data; new secrets must be written with encode_current().
     */
    [[nodiscard]] VaultResult<std::string> encode_legacy(
        const Glib::ustring& plaintext,
        const Glib::ustring& secret) const;

    /**
     * @brief Decrypt a legacy blob with the master password
     *
     * @return Plaintext; InvalidFormat when shorter than salt + IV;
     *         KeyDerivationError; DecryptionFailed
     */
    [[nodiscard]] VaultResult<SecureString> decode_legacy(
        std::string_view blob,
        const Glib::ustring& secret) const;

private:
    IRandomSource& m_random;
    std::shared_ptr<const ISymmetricCipher> m_cipher;
    Pbkdf2KeyDerivation m_legacy_kdf;
};

} // namespace SuperLocker
