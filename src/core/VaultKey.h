// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

#ifndef SUPERLOCKER_VAULT_KEY_H
#define SUPERLOCKER_VAULT_KEY_H

#include "VaultError.h"
#include "../utils/SecureMemory.h"
#include <algorithm>
#include <array>
#include <cstdint>
#include <memory>
#include <span>

namespace SuperLocker {

/**
 * @brief The 256-bit data key that encrypts every stored secret
 *
 * Generated once per account and persisted only wrapped under the
 * MasterKey. Instances are immutable and cleansed on destruction; they are
 * shared through VaultKeyHandle so that VaultKeyManager::lock() stops new
 * work without invalidating a decode that already holds the key.
 */
class VaultKey {
public:
    static constexpr size_t LENGTH = 32;

    explicit VaultKey(const std::array<uint8_t, LENGTH>& bytes) noexcept : m_key(bytes) {}

    ~VaultKey() {
        secure_clear(m_key);
    }

    VaultKey(const VaultKey&) = delete;
    VaultKey& operator=(const VaultKey&) = delete;

    [[nodiscard]] std::span<const uint8_t> bytes() const noexcept {
        return m_key;
    }

    /** @brief Constant-time comparison */
    [[nodiscard]] bool operator==(const VaultKey& other) const noexcept {
        return CRYPTO_memcmp(m_key.data(), other.m_key.data(), LENGTH) == 0;
    }

    /**
     * @brief Copy raw key bytes into a new shared key
     * @return Handle, or VaultError::InvalidKeySize if @p bytes is not 32 bytes
     */
    [[nodiscard]] static VaultResult<std::shared_ptr<const VaultKey>>
    from_bytes(std::span<const uint8_t> bytes);

private:
    std::array<uint8_t, LENGTH> m_key;
};

/** @brief Shared, read-only reference to an unwrapped vault key */
using VaultKeyHandle = std::shared_ptr<const VaultKey>;

inline VaultResult<VaultKeyHandle> VaultKey::from_bytes(std::span<const uint8_t> bytes) {
    if (bytes.size() != LENGTH) {
        return std::unexpected(VaultError::InvalidKeySize);
    }
    std::array<uint8_t, LENGTH> raw{};
    std::copy(bytes.begin(), bytes.end(), raw.begin());
    auto key = std::make_shared<const VaultKey>(raw);
    secure_clear(raw);
    return key;
}

} // namespace SuperLocker

#endif // SUPERLOCKER_VAULT_KEY_H
