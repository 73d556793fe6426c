// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

/**
 * @file VaultKeyManager.h
 * @brief Two-tier envelope key management for one account session
 *
 * The MasterKey is derived from the user's master password and a
 * per-account salt. It only ever wraps and unwraps the VaultKey, a random
 * 256-bit key generated once per account that encrypts every stored secret.
 * Changing the master password therefore re-wraps 32 bytes instead of
 * re-encrypting the whole vault.
 *
 * @section states States
 * - Locked (initial): no VaultKey in memory.
 * - Unlocked: the VaultKey is cached and handed out via vault_key().
 *
 * lock() returns to Locked from any state. Handles already given out stay
 * valid until their holders drop them; lock() only affects later calls.
 *
 * @section usage Usage Example
 * @code
 * VaultKeyManager manager(KdfAlgorithm::PBKDF2_HMAC_SHA256, params);
 * auto key = manager.unlock_from_store(user_id, SecureString{entered}.get(), store);
 * if (!key) {
 *     show_error(to_user_message(key.error()));   // "Incorrect master password"
 *     return;
 * }
 * auto blob = SecretCodec().encode_current("hunter2", **key);
 * @endcode
 *
 * Thread-safety: all public methods may be called concurrently; state
 * changes are serialized on an internal mutex. Key derivation runs outside
 * the lock.
 */

#ifndef SUPERLOCKER_VAULT_KEY_MANAGER_H
#define SUPERLOCKER_VAULT_KEY_MANAGER_H

#include "AccountKeyRecord.h"
#include "VaultError.h"
#include "VaultKey.h"
#include "crypto/KeyDerivation.h"
#include "crypto/RandomSource.h"
#include "crypto/SymmetricCipher.h"
#include <glibmm/ustring.h>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace SuperLocker {

class IAccountKeyStore;

class VaultKeyManager {
public:
    enum class State {
        Locked,
        Unlocked
    };

    /**
     * @brief Create a locked manager
     *
     * @param algorithm KDF used for new accounts and master-password changes.
     *        Unlocking always uses the algorithm recorded in the account record.
     * @param params Cost parameters for new accounts
     * @param random Source for salts, IVs and vault keys (must outlive the manager)
     * @param cipher Cipher used to wrap the vault key (AES-256-CBC when null)
     */
    explicit VaultKeyManager(
        KdfAlgorithm algorithm = KdfAlgorithm::PBKDF2_HMAC_SHA256,
        KdfParameters params = {},
        IRandomSource& random = OpenSslRandomSource::instance(),
        std::shared_ptr<const ISymmetricCipher> cipher = nullptr);

    ~VaultKeyManager();

    VaultKeyManager(const VaultKeyManager&) = delete;
    VaultKeyManager& operator=(const VaultKeyManager&) = delete;

    /**
     * @brief Create the key material for a brand-new account
     *
     * Generates salt, VaultKey and IV, derives the MasterKey and wraps the
     * VaultKey under it. The manager ends Unlocked with the new VaultKey.
     *
     * @warning Calling this for an account that already has secrets orphans
     *          them. Prefer initialize_and_store(), which refuses to overwrite.
     *
     * @param secret Master password (must not be empty)
     * @return Record to persist, or KeyDerivationError / RandomGenerationFailed /
     *         EncryptionFailed
     */
    [[nodiscard]] VaultResult<AccountKeyRecord> initialize_for_account(const Glib::ustring& secret);

    /**
     * @brief initialize_for_account() guarded against re-initialization
     *
     * @return Persisted record; AccountAlreadyInitialized if the store already
     *         holds a key document for @p account_id
     */
    [[nodiscard]] VaultResult<AccountKeyRecord> initialize_and_store(
        const std::string& account_id,
        const Glib::ustring& secret,
        IAccountKeyStore& store);

    /**
     * @brief Derive the MasterKey and unwrap the VaultKey
     *
     * Every failure (derivation, padding, unexpected key length) is reported
     * as UnlockFailed. A corrupted record and a wrong password are
     * indistinguishable to the caller. On failure the manager is Locked.
     */
    [[nodiscard]] VaultResult<VaultKeyHandle> unlock(
        const Glib::ustring& secret,
        const AccountKeyRecord& record);

    /**
     * @brief Load the account's key document and unlock with it
     *
     * @return VaultKey; AccountNotInitialized when the store has no document,
     *         StoreReadFailed on transport errors, otherwise as unlock()
     */
    [[nodiscard]] VaultResult<VaultKeyHandle> unlock_from_store(
        const std::string& account_id,
        const Glib::ustring& secret,
        IAccountKeyStore& store);

    /**
     * @brief Re-wrap the VaultKey under a new master password
     *
     * Unlocks with @p old_secret, then derives a new MasterKey from a fresh
     * salt and wraps the same VaultKey with a fresh IV. Stored secrets are
     * untouched. The manager is left Unlocked.
     *
     * @return New record to persist; UnlockFailed if @p old_secret is wrong
     */
    [[nodiscard]] VaultResult<AccountKeyRecord> change_master_secret(
        const Glib::ustring& old_secret,
        const Glib::ustring& new_secret,
        const AccountKeyRecord& record);

    /**
     * @brief change_master_secret() against the account's stored document
     */
    [[nodiscard]] VaultResult<AccountKeyRecord> change_master_secret_in_store(
        const std::string& account_id,
        const Glib::ustring& old_secret,
        const Glib::ustring& new_secret,
        IAccountKeyStore& store);

    /**
     * @brief Drop the cached VaultKey; safe in any state
     * @throws std::system_error if m_mutex cannot be acquired
     */
    void lock();

    [[nodiscard]] bool is_unlocked() const;

    [[nodiscard]] State state() const;

    /**
     * @brief Current VaultKey
     * @return Handle, or VaultLocked
     */
    [[nodiscard]] VaultResult<VaultKeyHandle> vault_key() const;

    /** @brief Account the session was opened through a store for, if any */
    [[nodiscard]] std::optional<std::string> current_account_id() const;

private:
    [[nodiscard]] VaultResult<AccountKeyRecord> wrap_for_new_secret(
        const Glib::ustring& secret,
        const VaultKey& vault_key);

    [[nodiscard]] VaultResult<VaultKeyHandle> unwrap(
        const Glib::ustring& secret,
        const AccountKeyRecord& record) const;

    [[nodiscard]] VaultResult<std::optional<AccountKeyRecord>> load_record(
        const std::string& account_id,
        IAccountKeyStore& store) const;

    void set_unlocked(VaultKeyHandle key, std::optional<std::string> account_id);

    KdfAlgorithm m_algorithm;
    KdfParameters m_params;
    IRandomSource& m_random;
    std::shared_ptr<const ISymmetricCipher> m_cipher;

    mutable std::mutex m_mutex;
    VaultKeyHandle m_vault_key;
    std::optional<std::string> m_account_id;
};

} // namespace SuperLocker

#endif // SUPERLOCKER_VAULT_KEY_MANAGER_H
