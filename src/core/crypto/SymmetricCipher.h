// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

/**
 * @file SymmetricCipher.h
 * @brief Block-cipher encryption of raw byte buffers
 *
 * Used both to wrap the VaultKey under the MasterKey and to encrypt each
 * stored secret under the VaultKey.
 *
 * @section limits Integrity
 * AES-256-CBC with PKCS#7 padding gives confidentiality only. There is no
 * authentication tag: a wrong key or a flipped bit is detected only when it
 * happens to break the padding of the final block. Callers reach the cipher
 * through ISymmetricCipher so an AEAD mode can replace it later.
 */

#pragma once

#include "../VaultError.h"
#include "../../utils/SecureMemory.h"
#include <array>
#include <cstdint>
#include <span>
#include <vector>

namespace SuperLocker {

class IRandomSource;

/**
 * @brief Interface for a symmetric cipher with an explicit IV
 */
class ISymmetricCipher {
public:
    virtual ~ISymmetricCipher() = default;

    /**
     * @brief Encrypt plaintext
     *
     * @param plaintext Data to encrypt (may be empty)
     * @param key Key of key_length() bytes
     * @param iv Fresh random IV of iv_length() bytes; never reuse with the same key
     * @return Ciphertext, or InvalidKeySize / InvalidIvSize / EncryptionFailed
     */
    [[nodiscard]] virtual VaultResult<std::vector<uint8_t>> encrypt(
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> key,
        std::span<const uint8_t> iv) const = 0;

    /**
     * @brief Decrypt ciphertext
     *
     * @return Plaintext in zeroizing storage, or DecryptionFailed when the
     *         length is not block aligned, the padding is invalid, or the
     *         library call fails (InvalidKeySize / InvalidIvSize for bad sizes)
     */
    [[nodiscard]] virtual VaultResult<SecureVector<uint8_t>> decrypt(
        std::span<const uint8_t> ciphertext,
        std::span<const uint8_t> key,
        std::span<const uint8_t> iv) const = 0;

    [[nodiscard]] virtual size_t key_length() const noexcept = 0;
    [[nodiscard]] virtual size_t iv_length() const noexcept = 0;
};

/**
 * @brief AES-256-CBC with PKCS#7 padding (OpenSSL EVP)
 *
 * Stateless; a fresh EVP context is created per call, so one instance may
 * be shared across threads.
 */
class AesCbcCipher final : public ISymmetricCipher {
public:
    static constexpr size_t KEY_LENGTH = 32;   ///< AES-256
    static constexpr size_t IV_LENGTH = 16;    ///< One AES block
    static constexpr size_t BLOCK_SIZE = 16;

    [[nodiscard]] VaultResult<std::vector<uint8_t>> encrypt(
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> key,
        std::span<const uint8_t> iv) const override;

    [[nodiscard]] VaultResult<SecureVector<uint8_t>> decrypt(
        std::span<const uint8_t> ciphertext,
        std::span<const uint8_t> key,
        std::span<const uint8_t> iv) const override;

    [[nodiscard]] size_t key_length() const noexcept override { return KEY_LENGTH; }
    [[nodiscard]] size_t iv_length() const noexcept override { return IV_LENGTH; }
};

/**
 * @brief Draw a fresh 16-byte IV
 */
[[nodiscard]] VaultResult<std::array<uint8_t, AesCbcCipher::IV_LENGTH>> generate_iv(IRandomSource& random);

} // namespace SuperLocker
