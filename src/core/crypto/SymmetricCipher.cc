// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

#include "SymmetricCipher.h"
#include "RandomSource.h"
#include "../../utils/Log.h"
#include <openssl/evp.h>
#include <limits>

namespace SuperLocker {

VaultResult<std::vector<uint8_t>> AesCbcCipher::encrypt(
    std::span<const uint8_t> plaintext,
    std::span<const uint8_t> key,
    std::span<const uint8_t> iv) const {

    if (key.size() != KEY_LENGTH) {
        Log::error("AesCbcCipher: Invalid key size {} (expected {})", key.size(), KEY_LENGTH);
        return std::unexpected(VaultError::InvalidKeySize);
    }
    if (iv.size() != IV_LENGTH) {
        Log::error("AesCbcCipher: Invalid IV size {} (expected {})", iv.size(), IV_LENGTH);
        return std::unexpected(VaultError::InvalidIvSize);
    }
    if (plaintext.size() > static_cast<size_t>(std::numeric_limits<int>::max()) - BLOCK_SIZE) {
        return std::unexpected(VaultError::EncryptionFailed);
    }

    EVPCipherContextPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        Log::error("AesCbcCipher: Failed to create cipher context");
        return std::unexpected(VaultError::EncryptionFailed);
    }

    // PKCS#7 padding is the EVP default for CBC
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_cbc(), nullptr, key.data(), iv.data()) != 1) {
        Log::error("AesCbcCipher: EVP_EncryptInit_ex failed");
        return std::unexpected(VaultError::EncryptionFailed);
    }

    // Padding adds between 1 and 16 bytes
    std::vector<uint8_t> ciphertext(plaintext.size() + BLOCK_SIZE);
    int len = 0;
    int total = 0;

    if (EVP_EncryptUpdate(ctx.get(), ciphertext.data(), &len,
                          plaintext.data(), static_cast<int>(plaintext.size())) != 1) {
        Log::error("AesCbcCipher: EVP_EncryptUpdate failed");
        return std::unexpected(VaultError::EncryptionFailed);
    }
    total = len;

    if (EVP_EncryptFinal_ex(ctx.get(), ciphertext.data() + total, &len) != 1) {
        Log::error("AesCbcCipher: EVP_EncryptFinal_ex failed");
        return std::unexpected(VaultError::EncryptionFailed);
    }
    total += len;

    ciphertext.resize(static_cast<size_t>(total));
    return ciphertext;
}

VaultResult<SecureVector<uint8_t>> AesCbcCipher::decrypt(
    std::span<const uint8_t> ciphertext,
    std::span<const uint8_t> key,
    std::span<const uint8_t> iv) const {

    if (key.size() != KEY_LENGTH) {
        Log::error("AesCbcCipher: Invalid key size {} (expected {})", key.size(), KEY_LENGTH);
        return std::unexpected(VaultError::InvalidKeySize);
    }
    if (iv.size() != IV_LENGTH) {
        Log::error("AesCbcCipher: Invalid IV size {} (expected {})", iv.size(), IV_LENGTH);
        return std::unexpected(VaultError::InvalidIvSize);
    }
    if (ciphertext.empty() || ciphertext.size() % BLOCK_SIZE != 0 ||
        ciphertext.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
        Log::debug("AesCbcCipher: Ciphertext length {} is not block aligned", ciphertext.size());
        return std::unexpected(VaultError::DecryptionFailed);
    }

    EVPCipherContextPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        Log::error("AesCbcCipher: Failed to create cipher context");
        return std::unexpected(VaultError::DecryptionFailed);
    }

    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_cbc(), nullptr, key.data(), iv.data()) != 1) {
        Log::error("AesCbcCipher: EVP_DecryptInit_ex failed");
        return std::unexpected(VaultError::DecryptionFailed);
    }

    SecureVector<uint8_t> plaintext(ciphertext.size() + BLOCK_SIZE);
    int len = 0;
    int total = 0;

    if (EVP_DecryptUpdate(ctx.get(), plaintext.data(), &len,
                          ciphertext.data(), static_cast<int>(ciphertext.size())) != 1) {
        Log::debug("AesCbcCipher: EVP_DecryptUpdate failed");
        return std::unexpected(VaultError::DecryptionFailed);
    }
    total = len;

    // Padding check; with a wrong key this fails most of the time, not always
    if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + total, &len) != 1) {
        Log::debug("AesCbcCipher: Bad padding (wrong key or corrupted data)");
        return std::unexpected(VaultError::DecryptionFailed);
    }
    total += len;

    plaintext.resize(static_cast<size_t>(total));
    return plaintext;
}

VaultResult<std::array<uint8_t, AesCbcCipher::IV_LENGTH>> generate_iv(IRandomSource& random) {
    std::array<uint8_t, AesCbcCipher::IV_LENGTH> iv{};
    if (auto result = random.fill(iv); !result) {
        return std::unexpected(result.error());
    }
    return iv;
}

} // namespace SuperLocker
