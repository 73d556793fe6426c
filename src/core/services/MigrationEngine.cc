// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

#include "MigrationEngine.h"
#include "../VaultKeyManager.h"
#include "../repositories/IAccountKeyStore.h"
#include "../../utils/Log.h"
#include <ctime>
#include <utility>

namespace SuperLocker {

MigrationEngine::MigrationEngine(SecretCodec codec)
    : m_codec(std::move(codec)) {}

// ============================================================================
// Migration
// ============================================================================

MigrationReport MigrationEngine::migrate_account(
    const Glib::ustring& secret,
    std::vector<SecretRecord>& records,
    const VaultKey& vault_key,
    ISecretRecordStore& store) const {

    MigrationReport report;

    for (auto& record : records) {
        switch (migrate_record(secret, record, vault_key, store)) {
            case Outcome::Migrated:
                ++report.migrated_count;
                break;
            case Outcome::AlreadyCurrent:
                ++report.already_current_count;
                break;
            case Outcome::Skipped:
                ++report.skipped_count;
                report.skipped_ids.push_back(record.id);
                break;
        }
    }

    Log::info("MigrationEngine: {} migrated, {} skipped, {} already current",
              report.migrated_count, report.skipped_count, report.already_current_count);
    return report;
}

MigrationEngine::Outcome MigrationEngine::migrate_record(
    const Glib::ustring& secret,
    SecretRecord& record,
    const VaultKey& vault_key,
    ISecretRecordStore& store) const {

    const BlobFormat format = SecretCodec::detect_format(record.encrypted_secret);
    switch (format) {
        case BlobFormat::Current:
            return Outcome::AlreadyCurrent;
        case BlobFormat::UntaggedCurrent:
            // A legacy blob cut on a block boundary also lands here
            if (!m_codec.decode_current(record.encrypted_secret, vault_key)) {
                Log::warning("MigrationEngine: Record {} is neither legacy nor readable, skipping",
                             record.id);
                return Outcome::Skipped;
            }
            return Outcome::AlreadyCurrent;
        case BlobFormat::Invalid:
            Log::warning("MigrationEngine: Record {} has an unrecognized blob, skipping", record.id);
            return Outcome::Skipped;
        case BlobFormat::Legacy:
            break;
    }

    auto plaintext = m_codec.decode_legacy(record.encrypted_secret, secret);
    if (!plaintext) {
        // Also reached by untagged current blobs too long to tell apart from legacy ones
        Log::warning("MigrationEngine: Record {} could not be decoded as legacy: {}",
                     record.id, to_string(plaintext.error()));
        return Outcome::Skipped;
    }

    auto blob = m_codec.encode_current(plaintext->get(), vault_key);
    if (!blob) {
        Log::error("MigrationEngine: Record {} could not be re-encrypted: {}",
                   record.id, to_string(blob.error()));
        return Outcome::Skipped;
    }

    if (auto stored = store.update_secret(record.id, *blob); !stored) {
        Log::error("MigrationEngine: Record {} could not be stored: {}",
                   record.id, to_string(stored.error()));
        return Outcome::Skipped;
    }

    record.encrypted_secret = std::move(*blob);
    record.updated_at = std::time(nullptr);
    Log::debug("MigrationEngine: Record {} migrated", record.id);
    return Outcome::Migrated;
}

VaultResult<MigrationReport> MigrationEngine::migrate_account_from_store(
    const std::string& account_id,
    const Glib::ustring& secret,
    std::vector<SecretRecord>& records,
    VaultKeyManager& manager,
    IAccountKeyStore& key_store,
    ISecretRecordStore& secret_store) const {

    VaultKeyHandle vault_key;
    if (manager.is_unlocked() && manager.current_account_id() == account_id) {
        auto current = manager.vault_key();
        if (current) {
            vault_key = std::move(*current);
        }
    }

    if (!vault_key) {
        auto unlocked = manager.unlock_from_store(account_id, secret, key_store);
        if (!unlocked) {
            Log::warning("MigrationEngine: Cannot migrate account {}: {}",
                         account_id, to_string(unlocked.error()));
            return std::unexpected(unlocked.error());
        }
        vault_key = std::move(*unlocked);
    }

    return migrate_account(secret, records, *vault_key, secret_store);
}

} // namespace SuperLocker
