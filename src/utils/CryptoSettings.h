// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

#ifndef SUPERLOCKER_CRYPTO_SETTINGS_H
#define SUPERLOCKER_CRYPTO_SETTINGS_H

#include "../core/crypto/KeyDerivation.h"
#include "../core/generator/PasswordGenerator.h"
#include "Log.h"
#include <giomm/settings.h>
#include <cstdint>
#include <string>

namespace SuperLocker {

/**
 * @brief Tunables of the crypto core, read from GSettings
 *
 * Every numeric value is clamped to a safe range on load, so a schema file
 * edited to allow weaker values cannot lower the floor at runtime.
 */
struct CryptoSettings {
    static constexpr const char* SCHEMA_ID = "com.superlocker.core";

    static inline constexpr uint32_t MIN_PBKDF2_ITERATIONS{100000};
    static inline constexpr uint32_t MAX_PBKDF2_ITERATIONS{KdfParameters::MAX_PBKDF2_ITERATIONS};
    static inline constexpr uint32_t MIN_ARGON2_MEMORY_KB{8192};      // 8 MiB
    static inline constexpr uint32_t MAX_ARGON2_MEMORY_KB{KdfParameters::MAX_ARGON2_MEMORY_KB};
    static inline constexpr uint32_t MIN_ARGON2_ITERATIONS{1};
    static inline constexpr uint32_t MAX_ARGON2_ITERATIONS{KdfParameters::MAX_ARGON2_TIME_COST};
    static inline constexpr uint32_t MIN_ARGON2_PARALLELISM{1};
    static inline constexpr uint32_t MAX_ARGON2_PARALLELISM{KdfParameters::MAX_ARGON2_PARALLELISM};
    static inline constexpr uint32_t MIN_BATCH_SIZE{1};
    static inline constexpr uint32_t MAX_BATCH_SIZE{64};
    static inline constexpr uint32_t MIN_GENERATOR_LENGTH{4};
    static inline constexpr uint32_t MAX_GENERATOR_LENGTH{128};

    KdfAlgorithm kdf_algorithm = KdfAlgorithm::PBKDF2_HMAC_SHA256;
    uint32_t pbkdf2_iterations = 100000;
    uint32_t argon2_memory_kb = 65536;
    uint32_t argon2_iterations = 3;
    uint32_t argon2_parallelism = 4;
    uint32_t decrypt_batch_size = 5;
    uint32_t generator_default_length = 16;
    bool generator_exclude_similar = true;
    Log::Level log_level = Log::Level::Info;

    /**
     * @brief Load and clamp every key of the schema
     * @param settings Settings bound to SCHEMA_ID; null yields the defaults
     */
    [[nodiscard]] static CryptoSettings from_settings(const Glib::RefPtr<Gio::Settings>& settings);

    /** @brief Clamp every field in place */
    void clamp();

    [[nodiscard]] KdfParameters kdf_parameters() const;

    [[nodiscard]] CharacterClasses generator_classes() const;

    /** @brief Length for passwords generated without an explicit length */
    [[nodiscard]] size_t generator_length() const { return generator_default_length; }

    /** @brief Entries decrypted concurrently by BatchDecryptor */
    [[nodiscard]] size_t batch_size() const { return decrypt_batch_size; }

    /** @brief Make log_level the process-wide minimum */
    void apply_log_level() const;
};

} // namespace SuperLocker

#endif // SUPERLOCKER_CRYPTO_SETTINGS_H
