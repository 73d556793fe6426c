// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

/**
 * @file MigrationEngine.h
 * @brief Re-encrypts legacy secrets under the account's VaultKey
 *
 * Responsibilities:
 * - Classify each stored blob
 * - Decode legacy blobs with the master password, re-encode them with the VaultKey
 * - Persist each re-encoded blob through ISecretRecordStore
 *
 * NOT responsible for:
 * - Deriving or unwrapping the VaultKey (see VaultKeyManager)
 * - Loading records from storage (the caller passes them in)
 */

#pragma once

#include "../AccountKeyRecord.h"
#include "../VaultError.h"
#include "../VaultKey.h"
#include "../format/SecretCodec.h"
#include <glibmm/ustring.h>
#include <string>
#include <vector>

namespace SuperLocker {

class IAccountKeyStore;
class ISecretRecordStore;
class VaultKeyManager;

/**
 * @brief Outcome of one migration pass
 *
 * migrated_count + skipped_count + already_current_count equals the number
 * of records passed in.
 */
struct MigrationReport {
    size_t migrated_count = 0;
    size_t skipped_count = 0;
    size_t already_current_count = 0;
    std::vector<std::string> skipped_ids;  ///< Records left untouched after a failure

    [[nodiscard]] size_t total() const noexcept {
        return migrated_count + skipped_count + already_current_count;
    }
};

/**
 * @class MigrationEngine
 * @brief Per-record, failure-tolerant legacy migration
 *
 * A failure on one record never aborts the batch; the record is counted as
 * skipped and keeps its original blob. Running the engine again over the
 * same records migrates nothing.
 *
 * Thread-safety: stateless apart from the codec; safe to share between
 * threads as long as the stores passed in are.
 */
class MigrationEngine {
public:
    explicit MigrationEngine(SecretCodec codec = SecretCodec{});

    /**
     * @brief Migrate every legacy record of one account
     *
     * @param secret Master password the legacy blobs were written with
     * @param records Records to process; migrated entries get their new blob
     * @param vault_key Unlocked VaultKey of the account
     * @param store Destination for re-encoded blobs
     * @return Counts per outcome
     */
    [[nodiscard]] MigrationReport migrate_account(
        const Glib::ustring& secret,
        std::vector<SecretRecord>& records,
        const VaultKey& vault_key,
        ISecretRecordStore& store) const;

    /**
     * @brief Unlock the account if needed, then migrate
     *
     * Reuses the manager's key when it is already unlocked for @p account_id;
     * otherwise runs one unlock against @p key_store.
     *
     * @return Report, or UnlockFailed / AccountNotInitialized / StoreReadFailed
     *         when the VaultKey cannot be obtained
     */
    [[nodiscard]] VaultResult<MigrationReport> migrate_account_from_store(
        const std::string& account_id,
        const Glib::ustring& secret,
        std::vector<SecretRecord>& records,
        VaultKeyManager& manager,
        IAccountKeyStore& key_store,
        ISecretRecordStore& secret_store) const;

    [[nodiscard]] const SecretCodec& codec() const noexcept { return m_codec; }

private:
    enum class Outcome {
        Migrated,
        Skipped,
        AlreadyCurrent
    };

    [[nodiscard]] Outcome migrate_record(
        const Glib::ustring& secret,
        SecretRecord& record,
        const VaultKey& vault_key,
        ISecretRecordStore& store) const;

    SecretCodec m_codec;
};

} // namespace SuperLocker
