// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

/**
 * @file KeyDerivation.h
 * @brief Password-based derivation of the 256-bit MasterKey
 *
 * Turns the user's master password plus a per-account salt into key
 * material. The cost is deliberately high so a captured salt and wrapped
 * vault key cannot be brute-forced cheaply.
 *
 * Algorithms:
 * - PBKDF2-HMAC-SHA256 (default, 100,000 iterations). All existing accounts
 *   and every legacy blob use this.
 * - Argon2id (memory-hard, opt-in through settings for new accounts).
 *
 * Callers depend on IKeyDerivation only, so the primitive can be swapped
 * without touching VaultKeyManager or SecretCodec.
 */

#pragma once

#include "../VaultError.h"
#include "../../utils/SecureMemory.h"
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string_view>

namespace SuperLocker {

/**
 * @brief Key derivation algorithm identifier
 *
 * Values are persisted in the account key record (as their string names).
 */
enum class KdfAlgorithm : uint8_t {
    PBKDF2_HMAC_SHA256 = 0x04,
    ARGON2ID = 0x05
};

/**
 * @brief Cost parameters for both algorithms
 */
struct KdfParameters {
    // Upper bounds accepted from stored records and settings
    static constexpr uint32_t MAX_PBKDF2_ITERATIONS = 10000000;
    static constexpr uint32_t MAX_ARGON2_MEMORY_KB = 1048576;   // 1 GiB
    static constexpr uint32_t MAX_ARGON2_TIME_COST = 10;
    static constexpr uint32_t MAX_ARGON2_PARALLELISM = 16;

    uint32_t pbkdf2_iterations = 100000;  ///< PBKDF2 iteration count
    uint32_t argon2_memory_kb = 65536;    ///< Argon2 memory cost in KiB
    uint32_t argon2_time_cost = 3;        ///< Argon2 passes
    uint32_t argon2_parallelism = 4;      ///< Argon2 lanes
};

/**
 * @brief Interface for password-based key derivation
 *
 * Implementations are pure: identical (secret, salt) always yields the
 * identical 32-byte key, and nothing is logged about either input.
 */
class IKeyDerivation {
public:
    /** @brief Output length in bytes (AES-256 key) */
    static constexpr size_t OUTPUT_LENGTH = 32;

    virtual ~IKeyDerivation() = default;

    /**
     * @brief Derive a 32-byte key
     *
     * @param secret UTF-8 master password
     * @param salt Per-account (or per-legacy-blob) salt
     * @return Key in zeroizing storage, or VaultError::KeyDerivationError
     *         when the secret or salt is empty or the library call fails
     */
    [[nodiscard]] virtual VaultResult<SecureVector<uint8_t>>
    derive(std::string_view secret, std::span<const uint8_t> salt) const = 0;

    [[nodiscard]] virtual KdfAlgorithm algorithm() const noexcept = 0;

    /** @brief Primary cost figure (PBKDF2 iterations or Argon2 passes) */
    [[nodiscard]] virtual uint32_t cost() const noexcept = 0;
};

class Pbkdf2KeyDerivation final : public IKeyDerivation {
public:
    static constexpr uint32_t DEFAULT_ITERATIONS = 100000;

    explicit Pbkdf2KeyDerivation(uint32_t iterations = DEFAULT_ITERATIONS) noexcept
        : m_iterations(iterations) {}

    [[nodiscard]] VaultResult<SecureVector<uint8_t>>
    derive(std::string_view secret, std::span<const uint8_t> salt) const override;

    [[nodiscard]] KdfAlgorithm algorithm() const noexcept override {
        return KdfAlgorithm::PBKDF2_HMAC_SHA256;
    }

    [[nodiscard]] uint32_t cost() const noexcept override { return m_iterations; }

private:
    uint32_t m_iterations;
};

class Argon2idKeyDerivation final : public IKeyDerivation {
public:
    Argon2idKeyDerivation(uint32_t memory_kb, uint32_t time_cost, uint32_t parallelism) noexcept
        : m_memory_kb(memory_kb), m_time_cost(time_cost), m_parallelism(parallelism) {}

    [[nodiscard]] VaultResult<SecureVector<uint8_t>>
    derive(std::string_view secret, std::span<const uint8_t> salt) const override;

    [[nodiscard]] KdfAlgorithm algorithm() const noexcept override {
        return KdfAlgorithm::ARGON2ID;
    }

    [[nodiscard]] uint32_t cost() const noexcept override { return m_time_cost; }

    [[nodiscard]] uint32_t memory_kb() const noexcept { return m_memory_kb; }
    [[nodiscard]] uint32_t parallelism() const noexcept { return m_parallelism; }

private:
    uint32_t m_memory_kb;
    uint32_t m_time_cost;
    uint32_t m_parallelism;
};

/**
 * @brief Build the derivation for an algorithm and its parameters
 */
[[nodiscard]] std::unique_ptr<IKeyDerivation>
make_key_derivation(KdfAlgorithm algorithm, const KdfParameters& params);

[[nodiscard]] constexpr std::string_view algorithm_to_string(KdfAlgorithm algorithm) noexcept {
    switch (algorithm) {
        case KdfAlgorithm::PBKDF2_HMAC_SHA256: return "pbkdf2";
        case KdfAlgorithm::ARGON2ID: return "argon2id";
    }
    return "unknown";
}

/**
 * @brief Parse a persisted or configured algorithm name
 * @return Algorithm, or std::nullopt for unknown names
 */
[[nodiscard]] constexpr std::optional<KdfAlgorithm> algorithm_from_string(std::string_view name) noexcept {
    if (name == "pbkdf2") return KdfAlgorithm::PBKDF2_HMAC_SHA256;
    if (name == "argon2id") return KdfAlgorithm::ARGON2ID;
    return std::nullopt;
}

} // namespace SuperLocker
