// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

#pragma once

#include "IAccountKeyStore.h"
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace SuperLocker {

/**
 * @brief Process-local implementation of both store interfaces
 *
 * Backs the unit tests and offline tooling. Thread-safe.
 */
class InMemoryDocumentStore final : public IAccountKeyStore, public ISecretRecordStore {
public:
    [[nodiscard]] VaultResult<std::optional<Document>>
    get(const std::string& account_id) override;

    [[nodiscard]] VaultResult<void>
    put(const std::string& account_id, const Document& document) override;

    [[nodiscard]] VaultResult<void>
    update_secret(const std::string& record_id, const std::string& encrypted_secret) override;

    /** @brief Insert or replace a secret blob directly (seeding) */
    void put_secret(const std::string& record_id, const std::string& encrypted_secret);

    [[nodiscard]] std::optional<std::string> get_secret(const std::string& record_id) const;

    /** @brief Snapshot of all secret records, ordered by id */
    [[nodiscard]] std::vector<SecretRecord> secret_records() const;

    /** @brief Number of successful update_secret() calls */
    [[nodiscard]] size_t update_count() const;

private:
    mutable std::mutex m_mutex;
    std::map<std::string, Document> m_accounts;
    std::map<std::string, std::string> m_secrets;
    size_t m_update_count = 0;
};

} // namespace SuperLocker
