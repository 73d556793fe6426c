// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

#include "KeyDerivation.h"
#include "../../utils/Log.h"
#include <openssl/evp.h>
#include <argon2.h>
#include <chrono>
#include <limits>

namespace SuperLocker {

namespace {

// Shared input checks: empty secrets are rejected here rather than upstream
bool inputs_valid(std::string_view secret, std::span<const uint8_t> salt) {
    if (secret.empty()) {
        Log::error("KeyDerivation: Refusing to derive from an empty secret");
        return false;
    }
    if (salt.empty()) {
        Log::error("KeyDerivation: Refusing to derive with an empty salt");
        return false;
    }
    return true;
}

} // namespace

VaultResult<SecureVector<uint8_t>>
Pbkdf2KeyDerivation::derive(std::string_view secret, std::span<const uint8_t> salt) const {
    if (!inputs_valid(secret, salt)) {
        return std::unexpected(VaultError::KeyDerivationError);
    }
    if (m_iterations == 0 || m_iterations > static_cast<uint32_t>(std::numeric_limits<int>::max())) {
        Log::error("KeyDerivation: Invalid PBKDF2 iteration count {}", m_iterations);
        return std::unexpected(VaultError::KeyDerivationError);
    }

    SecureVector<uint8_t> key(OUTPUT_LENGTH);
    const auto start = std::chrono::steady_clock::now();

    int result = PKCS5_PBKDF2_HMAC(
        secret.data(), static_cast<int>(secret.size()),
        salt.data(), static_cast<int>(salt.size()),
        static_cast<int>(m_iterations),
        EVP_sha256(),
        static_cast<int>(OUTPUT_LENGTH),
        key.data()
    );

    if (result != 1) {
        Log::error("KeyDerivation: PBKDF2 failed");
        return std::unexpected(VaultError::KeyDerivationError);
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    Log::debug("KeyDerivation: PBKDF2-HMAC-SHA256 ({} iterations) took {} ms",
               m_iterations, elapsed.count());
    return key;
}

VaultResult<SecureVector<uint8_t>>
Argon2idKeyDerivation::derive(std::string_view secret, std::span<const uint8_t> salt) const {
    if (!inputs_valid(secret, salt)) {
        return std::unexpected(VaultError::KeyDerivationError);
    }

    SecureVector<uint8_t> key(OUTPUT_LENGTH);
    const auto start = std::chrono::steady_clock::now();

    // libargon2 validates the cost parameters and the salt length (>= 8)
    int result = argon2id_hash_raw(
        m_time_cost,
        m_memory_kb,
        m_parallelism,
        secret.data(), secret.size(),
        salt.data(), salt.size(),
        key.data(), key.size()
    );

    if (result != ARGON2_OK) {
        Log::error("KeyDerivation: Argon2id failed: {}", argon2_error_message(result));
        return std::unexpected(VaultError::KeyDerivationError);
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    Log::debug("KeyDerivation: Argon2id ({} KiB, {} passes, {} lanes) took {} ms",
               m_memory_kb, m_time_cost, m_parallelism, elapsed.count());
    return key;
}

std::unique_ptr<IKeyDerivation>
make_key_derivation(KdfAlgorithm algorithm, const KdfParameters& params) {
    switch (algorithm) {
        case KdfAlgorithm::ARGON2ID:
            return std::make_unique<Argon2idKeyDerivation>(
                params.argon2_memory_kb, params.argon2_time_cost, params.argon2_parallelism);
        case KdfAlgorithm::PBKDF2_HMAC_SHA256:
            break;
    }
    return std::make_unique<Pbkdf2KeyDerivation>(params.pbkdf2_iterations);
}

} // namespace SuperLocker
