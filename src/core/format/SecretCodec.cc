// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

#include "SecretCodec.h"
#include "../../utils/Base64.h"
#include "../../utils/Log.h"
#include <openssl/crypto.h>
#include <array>
#include <span>
#include <utility>
#include <vector>

namespace SuperLocker {

namespace {

std::span<const uint8_t> as_bytes(const Glib::ustring& text) {
    return {reinterpret_cast<const uint8_t*>(text.data()), text.bytes()};
}

bool is_tagged(const std::vector<uint8_t>& bytes) {
    return bytes.size() % AesCbcCipher::BLOCK_SIZE == 1 &&
           bytes.front() == SecretCodec::FORMAT_TAG_VAULT_KEY;
}

// Plaintext bytes -> validated UTF-8 text; the temporary copy is cleansed
VaultResult<SecureString> to_secure_text(const SecureVector<uint8_t>& plaintext) {
    std::string bytes(reinterpret_cast<const char*>(plaintext.data()), plaintext.size());
    Glib::ustring text(bytes);
    OPENSSL_cleanse(bytes.data(), bytes.size());

    SecureString result(std::move(text));
    if (!result.get().validate()) {
        Log::debug("SecretCodec: Decrypted payload is not valid UTF-8");
        return std::unexpected(VaultError::DecryptionFailed);
    }
    return result;
}

} // namespace

SecretCodec::SecretCodec(
    IRandomSource& random,
    std::shared_ptr<const ISymmetricCipher> cipher,
    uint32_t legacy_iterations)
    : m_random(random),
      m_cipher(cipher ? std::move(cipher) : std::make_shared<const AesCbcCipher>()),
      m_legacy_kdf(legacy_iterations) {}

// ============================================================================
// Format detection
// ============================================================================

BlobFormat SecretCodec::detect_format(std::string_view blob) {
    auto bytes = Base64::decode(blob);
    if (!bytes || bytes->empty()) {
        return BlobFormat::Invalid;
    }

    const size_t size = bytes->size();
    if (is_tagged(*bytes) && size >= 1 + IV_LENGTH + AesCbcCipher::BLOCK_SIZE) {
        return BlobFormat::Current;
    }
    if (size % AesCbcCipher::BLOCK_SIZE != 0 && size < LEGACY_MIN_LENGTH) {
        return BlobFormat::Invalid;
    }
    if (size >= LEGACY_MIN_LENGTH) {
        return BlobFormat::Legacy;
    }
    if (size >= IV_LENGTH + AesCbcCipher::BLOCK_SIZE) {
        return BlobFormat::UntaggedCurrent;
    }
    return BlobFormat::Invalid;
}

bool SecretCodec::is_legacy_format(std::string_view blob) {
    return detect_format(blob) == BlobFormat::Legacy;
}

// ============================================================================
// Vault-key layout
// ============================================================================

VaultResult<std::string> SecretCodec::encode_current(
    const Glib::ustring& plaintext,
    const VaultKey& vault_key) const {

    auto iv = generate_iv(m_random);
    if (!iv) {
        return std::unexpected(iv.error());
    }

    auto ciphertext = m_cipher->encrypt(as_bytes(plaintext), vault_key.bytes(), *iv);
    if (!ciphertext) {
        Log::error("SecretCodec: Encryption failed: {}", to_string(ciphertext.error()));
        return std::unexpected(VaultError::EncryptionFailed);
    }

    std::vector<uint8_t> blob;
    blob.reserve(1 + iv->size() + ciphertext->size());
    blob.push_back(FORMAT_TAG_VAULT_KEY);
    blob.insert(blob.end(), iv->begin(), iv->end());
    blob.insert(blob.end(), ciphertext->begin(), ciphertext->end());

    return Base64::encode(blob);
}

VaultResult<SecureString> SecretCodec::decode_current(
    std::string_view blob,
    const VaultKey& vault_key) const {

    auto bytes = Base64::decode(blob);
    if (!bytes) {
        Log::debug("SecretCodec: Blob is not valid base64");
        return std::unexpected(VaultError::InvalidFormat);
    }

    std::span<const uint8_t> payload(*bytes);
    if (!bytes->empty() && is_tagged(*bytes)) {
        payload = payload.subspan(1);
    }

    if (payload.size() < IV_LENGTH) {
        Log::debug("SecretCodec: Blob of {} bytes is shorter than its IV", payload.size());
        return std::unexpected(VaultError::InvalidFormat);
    }

    auto plaintext = m_cipher->decrypt(payload.subspan(IV_LENGTH),
                                       vault_key.bytes(),
                                       payload.first(IV_LENGTH));
    if (!plaintext) {
        return std::unexpected(plaintext.error());
    }
    return to_secure_text(*plaintext);
}

// ============================================================================
// Legacy layout
// ============================================================================

VaultResult<std::string> SecretCodec::encode_legacy(
    const Glib::ustring& plaintext,
    const Glib::ustring& secret) const {

    std::array<uint8_t, LEGACY_SALT_LENGTH> salt{};
    if (auto filled = m_random.fill(salt); !filled) {
        return std::unexpected(filled.error());
    }
    auto iv = generate_iv(m_random);
    if (!iv) {
        return std::unexpected(iv.error());
    }

    auto key = m_legacy_kdf.derive(secret.raw(), salt);
    if (!key) {
        return std::unexpected(key.error());
    }

    auto ciphertext = m_cipher->encrypt(as_bytes(plaintext), *key, *iv);
    if (!ciphertext) {
        return std::unexpected(VaultError::EncryptionFailed);
    }

    std::vector<uint8_t> blob;
    blob.reserve(LEGACY_HEADER_LENGTH + ciphertext->size());
    blob.insert(blob.end(), salt.begin(), salt.end());
    blob.insert(blob.end(), iv->begin(), iv->end());
    blob.insert(blob.end(), ciphertext->begin(), ciphertext->end());

    return Base64::encode(blob);
}

VaultResult<SecureString> SecretCodec::decode_legacy(
    std::string_view blob,
    const Glib::ustring& secret) const {

    auto bytes = Base64::decode(blob);
    if (!bytes) {
        return std::unexpected(VaultError::InvalidFormat);
    }
    if (bytes->size() < LEGACY_HEADER_LENGTH) {
        Log::debug("SecretCodec: Legacy blob of {} bytes has no room for salt and IV", bytes->size());
        return std::unexpected(VaultError::InvalidFormat);
    }

    std::span<const uint8_t> data(*bytes);
    auto salt = data.first(LEGACY_SALT_LENGTH);
    auto iv = data.subspan(LEGACY_SALT_LENGTH, IV_LENGTH);
    auto ciphertext = data.subspan(LEGACY_HEADER_LENGTH);

    auto key = m_legacy_kdf.derive(secret.raw(), salt);
    if (!key) {
        return std::unexpected(key.error());
    }

    auto plaintext = m_cipher->decrypt(ciphertext, *key, iv);
    if (!plaintext) {
        return std::unexpected(plaintext.error());
    }
    return to_secure_text(*plaintext);
}

} // namespace SuperLocker
