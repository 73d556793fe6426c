// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

#include "VaultKeyManager.h"
#include "repositories/IAccountKeyStore.h"
#include "../utils/Log.h"
#include "../utils/SecureMemory.h"
#include <algorithm>

namespace SuperLocker {

VaultKeyManager::VaultKeyManager(
    KdfAlgorithm algorithm,
    KdfParameters params,
    IRandomSource& random,
    std::shared_ptr<const ISymmetricCipher> cipher)
    : m_algorithm(algorithm),
      m_params(params),
      m_random(random),
      m_cipher(cipher ? std::move(cipher) : std::make_shared<const AesCbcCipher>()) {}

// No other thread can hold a reference once destruction starts, so the
// members are released without taking m_mutex
VaultKeyManager::~VaultKeyManager() {
    m_vault_key.reset();
    m_account_id.reset();
}

// ============================================================================
// Account initialization
// ============================================================================

VaultResult<AccountKeyRecord> VaultKeyManager::initialize_for_account(const Glib::ustring& secret) {
    std::array<uint8_t, VaultKey::LENGTH> raw_key{};
    if (auto filled = m_random.fill(raw_key); !filled) {
        Log::error("VaultKeyManager: Failed to generate vault key");
        return std::unexpected(filled.error());
    }
    auto vault_key = std::make_shared<const VaultKey>(raw_key);
    secure_clear(raw_key);

    auto record = wrap_for_new_secret(secret, *vault_key);
    if (!record) {
        return std::unexpected(record.error());
    }

    set_unlocked(std::move(vault_key), std::nullopt);
    Log::info("VaultKeyManager: Vault key initialized ({}, cost {})",
              algorithm_to_string(record->kdf_algorithm), record->iterations);
    return record;
}

VaultResult<AccountKeyRecord> VaultKeyManager::initialize_and_store(
    const std::string& account_id,
    const Glib::ustring& secret,
    IAccountKeyStore& store) {

    auto existing = store.get(account_id);
    if (!existing) {
        Log::error("VaultKeyManager: Could not check for existing key document of '{}'", account_id);
        return std::unexpected(VaultError::StoreReadFailed);
    }
    if (existing->has_value()) {
        Log::warning("VaultKeyManager: Refusing to re-initialize account '{}'", account_id);
        return std::unexpected(VaultError::AccountAlreadyInitialized);
    }

    auto record = initialize_for_account(secret);
    if (!record) {
        return record;
    }

    if (auto stored = store.put(account_id, record->to_document()); !stored) {
        Log::error("VaultKeyManager: Failed to persist key document for '{}'", account_id);
        lock();
        return std::unexpected(VaultError::StoreWriteFailed);
    }

    std::lock_guard guard(m_mutex);
    m_account_id = account_id;
    return record;
}

// ============================================================================
// Unlock / lock
// ============================================================================

VaultResult<VaultKeyHandle> VaultKeyManager::unlock(
    const Glib::ustring& secret,
    const AccountKeyRecord& record) {

    auto key = unwrap(secret, record);
    if (!key) {
        lock();
        return std::unexpected(VaultError::UnlockFailed);
    }

    set_unlocked(*key, std::nullopt);
    Log::info("VaultKeyManager: Vault unlocked");
    return key;
}

VaultResult<VaultKeyHandle> VaultKeyManager::unlock_from_store(
    const std::string& account_id,
    const Glib::ustring& secret,
    IAccountKeyStore& store) {

    auto record = load_record(account_id, store);
    if (!record) {
        return std::unexpected(record.error());
    }
    if (!record->has_value()) {
        Log::warning("VaultKeyManager: No key document for account '{}'", account_id);
        return std::unexpected(VaultError::AccountNotInitialized);
    }

    auto key = unlock(secret, **record);
    if (key) {
        std::lock_guard guard(m_mutex);
        m_account_id = account_id;
    }
    return key;
}

void VaultKeyManager::lock() {
    std::lock_guard guard(m_mutex);
    m_vault_key.reset();
    m_account_id.reset();
}

bool VaultKeyManager::is_unlocked() const {
    std::lock_guard guard(m_mutex);
    return static_cast<bool>(m_vault_key);
}

VaultKeyManager::State VaultKeyManager::state() const {
    return is_unlocked() ? State::Unlocked : State::Locked;
}

VaultResult<VaultKeyHandle> VaultKeyManager::vault_key() const {
    std::lock_guard guard(m_mutex);
    if (!m_vault_key) {
        return std::unexpected(VaultError::VaultLocked);
    }
    return m_vault_key;
}

std::optional<std::string> VaultKeyManager::current_account_id() const {
    std::lock_guard guard(m_mutex);
    return m_account_id;
}

// ============================================================================
// Master password change
// ============================================================================

VaultResult<AccountKeyRecord> VaultKeyManager::change_master_secret(
    const Glib::ustring& old_secret,
    const Glib::ustring& new_secret,
    const AccountKeyRecord& record) {

    auto key = unlock(old_secret, record);
    if (!key) {
        Log::warning("VaultKeyManager: Current master password rejected during change");
        return std::unexpected(key.error());
    }

    auto rewrapped = wrap_for_new_secret(new_secret, **key);
    if (!rewrapped) {
        return std::unexpected(rewrapped.error());
    }

    Log::info("VaultKeyManager: Vault key re-wrapped under new master password");
    return rewrapped;
}

VaultResult<AccountKeyRecord> VaultKeyManager::change_master_secret_in_store(
    const std::string& account_id,
    const Glib::ustring& old_secret,
    const Glib::ustring& new_secret,
    IAccountKeyStore& store) {

    auto record = load_record(account_id, store);
    if (!record) {
        return std::unexpected(record.error());
    }
    if (!record->has_value()) {
        return std::unexpected(VaultError::AccountNotInitialized);
    }

    auto rewrapped = change_master_secret(old_secret, new_secret, **record);
    if (!rewrapped) {
        return rewrapped;
    }

    if (auto stored = store.put(account_id, rewrapped->to_document()); !stored) {
        // The old document is still in place and still opens with old_secret
        Log::error("VaultKeyManager: Failed to persist re-wrapped key for '{}'", account_id);
        return std::unexpected(VaultError::StoreWriteFailed);
    }

    std::lock_guard guard(m_mutex);
    m_account_id = account_id;
    return rewrapped;
}

// ============================================================================
// Internals
// ============================================================================

VaultResult<AccountKeyRecord> VaultKeyManager::wrap_for_new_secret(
    const Glib::ustring& secret,
    const VaultKey& vault_key) {

    AccountKeyRecord record;
    record.kdf_algorithm = m_algorithm;
    if (m_algorithm == KdfAlgorithm::ARGON2ID) {
        record.iterations = m_params.argon2_time_cost;
        record.argon2_memory_kb = m_params.argon2_memory_kb;
        record.argon2_parallelism = m_params.argon2_parallelism;
    } else {
        record.iterations = m_params.pbkdf2_iterations;
    }

    if (auto filled = m_random.fill(record.salt); !filled) {
        Log::error("VaultKeyManager: Failed to generate salt");
        return std::unexpected(filled.error());
    }

    auto iv = generate_iv(m_random);
    if (!iv) {
        Log::error("VaultKeyManager: Failed to generate vault key IV");
        return std::unexpected(iv.error());
    }
    record.vault_key_iv = *iv;

    auto kdf = make_key_derivation(record.kdf_algorithm, record.kdf_parameters());
    auto master_key = kdf->derive(secret.raw(), record.salt);
    if (!master_key) {
        return std::unexpected(master_key.error());
    }

    auto wrapped = m_cipher->encrypt(vault_key.bytes(), *master_key, record.vault_key_iv);
    if (!wrapped) {
        Log::error("VaultKeyManager: Failed to wrap vault key: {}", to_string(wrapped.error()));
        return std::unexpected(VaultError::EncryptionFailed);
    }
    record.encrypted_vault_key = std::move(*wrapped);

    // master_key is cleansed here; it is never cached
    return record;
}

VaultResult<VaultKeyHandle> VaultKeyManager::unwrap(
    const Glib::ustring& secret,
    const AccountKeyRecord& record) const {

    auto kdf = make_key_derivation(record.kdf_algorithm, record.kdf_parameters());
    auto master_key = kdf->derive(secret.raw(), record.salt);
    if (!master_key) {
        Log::debug("VaultKeyManager: Master key derivation failed");
        return std::unexpected(master_key.error());
    }

    auto raw = m_cipher->decrypt(record.encrypted_vault_key, *master_key, record.vault_key_iv);
    if (!raw) {
        Log::debug("VaultKeyManager: Vault key unwrap failed");
        return std::unexpected(raw.error());
    }

    // A wrong key can pass the padding check; the length check catches most of those
    if (raw->size() != VaultKey::LENGTH) {
        Log::debug("VaultKeyManager: Unwrapped key has {} bytes", raw->size());
        return std::unexpected(VaultError::DecryptionFailed);
    }

    return VaultKey::from_bytes(*raw);
}

VaultResult<std::optional<AccountKeyRecord>> VaultKeyManager::load_record(
    const std::string& account_id,
    IAccountKeyStore& store) const {

    auto document = store.get(account_id);
    if (!document) {
        Log::error("VaultKeyManager: Failed to read key document for '{}'", account_id);
        return std::unexpected(VaultError::StoreReadFailed);
    }
    if (!document->has_value()) {
        return std::optional<AccountKeyRecord>{};
    }

    auto record = AccountKeyRecord::from_document(**document);
    if (!record) {
        // Malformed key documents read as a failed unlock, like corrupted ciphertext
        return std::unexpected(VaultError::UnlockFailed);
    }
    return std::optional<AccountKeyRecord>{std::move(*record)};
}

void VaultKeyManager::set_unlocked(VaultKeyHandle key, std::optional<std::string> account_id) {
    std::lock_guard guard(m_mutex);
    m_vault_key = std::move(key);
    m_account_id = std::move(account_id);
}

} // namespace SuperLocker
