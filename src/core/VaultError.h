// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng
//
// VaultError.h - Error kinds for the envelope-encryption core
// C++23 std::expected-based error handling

#ifndef SUPERLOCKER_VAULT_ERROR_H
#define SUPERLOCKER_VAULT_ERROR_H

#include <expected>
#include <string_view>

namespace SuperLocker {

// Closed set of failures surfaced by the core
enum class VaultError {
    // Cryptography
    DecryptionFailed,        // wrong key, corrupted ciphertext or bad padding
    EncryptionFailed,
    KeyDerivationError,      // malformed KDF input (empty secret/salt, bad cost)
    RandomGenerationFailed,
    InvalidKeySize,
    InvalidIvSize,

    // Blob format
    InvalidFormat,           // too short or undecodable to hold the expected header

    // Session
    UnlockFailed,            // wrong master password (cause deliberately hidden)
    VaultLocked,
    AccountAlreadyInitialized,
    AccountNotInitialized,

    // Persistence collaborator
    StoreReadFailed,
    StoreWriteFailed,

    // Password generator
    NoCharacterClasses,
    InvalidLength
};

inline constexpr std::string_view to_string(VaultError error) noexcept {
    switch (error) {
        case VaultError::DecryptionFailed:
            return "Decryption failed";
        case VaultError::EncryptionFailed:
            return "Encryption failed";
        case VaultError::KeyDerivationError:
            return "Key derivation failed";
        case VaultError::RandomGenerationFailed:
            return "Secure random generation failed";
        case VaultError::InvalidKeySize:
            return "Invalid key size";
        case VaultError::InvalidIvSize:
            return "Invalid IV size";
        case VaultError::InvalidFormat:
            return "Invalid ciphertext format";
        case VaultError::UnlockFailed:
            return "Unlock failed";
        case VaultError::VaultLocked:
            return "Vault is locked";
        case VaultError::AccountAlreadyInitialized:
            return "Account vault key already initialized";
        case VaultError::AccountNotInitialized:
            return "Account vault key not initialized";
        case VaultError::StoreReadFailed:
            return "Failed to read from store";
        case VaultError::StoreWriteFailed:
            return "Failed to write to store";
        case VaultError::NoCharacterClasses:
            return "At least one character type must be included";
        case VaultError::InvalidLength:
            return "Invalid password length";
    }
    return "Unknown error";
}

// Text shown to the user. Unlock-path failures never expose their cause.
inline constexpr std::string_view to_user_message(VaultError error) noexcept {
    switch (error) {
        case VaultError::UnlockFailed:
            return "Incorrect master password";
        default:
            return to_string(error);
    }
}

template<typename T = void>
using VaultResult = std::expected<T, VaultError>;

} // namespace SuperLocker

#endif // SUPERLOCKER_VAULT_ERROR_H
