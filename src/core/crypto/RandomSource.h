// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

/**
 * @file RandomSource.h
 * @brief Cryptographically secure byte source shared by every component
 *
 * Salts, IVs, vault keys and generated passwords all come from an
 * IRandomSource. Production code uses OpenSslRandomSource; tests may inject
 * their own implementation.
 */

#pragma once

#include "../VaultError.h"
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace SuperLocker {

/**
 * @brief Interface for a CSPRNG
 *
 * Implementations must never return predictable output. On failure the
 * destination buffer is cleansed and RandomGenerationFailed is returned.
 */
class IRandomSource {
public:
    virtual ~IRandomSource() = default;

    /**
     * @brief Fill a buffer with random bytes
     * @param out Destination buffer
     * @return Success, or VaultError::RandomGenerationFailed
     */
    [[nodiscard]] virtual VaultResult<void> fill(std::span<uint8_t> out) = 0;

    /**
     * @brief Allocate and fill @p length random bytes
     */
    [[nodiscard]] VaultResult<std::vector<uint8_t>> bytes(size_t length);

    /**
     * @brief Uniformly distributed index in [0, bound)
     *
     * Uses rejection sampling over 32-bit draws so no index is favoured.
     *
     * @param bound Exclusive upper bound (must be > 0)
     * @return Index, or RandomGenerationFailed (also for bound == 0)
     */
    [[nodiscard]] VaultResult<size_t> uniform_index(size_t bound);
};

/**
 * @brief IRandomSource backed by OpenSSL RAND_bytes()
 *
 * Thread-safe: RAND_bytes uses a per-thread DRBG in OpenSSL 3.
 */
class OpenSslRandomSource final : public IRandomSource {
public:
    [[nodiscard]] VaultResult<void> fill(std::span<uint8_t> out) override;

    /**
     * @brief Process-wide instance for callers that do not inject their own
     */
    [[nodiscard]] static OpenSslRandomSource& instance();
};

} // namespace SuperLocker
