// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

#include "InMemoryDocumentStore.h"
#include "../../utils/Log.h"

namespace SuperLocker {

VaultResult<std::optional<Document>>
InMemoryDocumentStore::get(const std::string& account_id) {
    std::lock_guard lock(m_mutex);
    auto it = m_accounts.find(account_id);
    if (it == m_accounts.end()) {
        return std::optional<Document>{};
    }
    return std::optional<Document>{it->second};
}

VaultResult<void>
InMemoryDocumentStore::put(const std::string& account_id, const Document& document) {
    std::lock_guard lock(m_mutex);
    m_accounts[account_id] = document;
    return {};
}

VaultResult<void>
InMemoryDocumentStore::update_secret(const std::string& record_id, const std::string& encrypted_secret) {
    std::lock_guard lock(m_mutex);
    auto it = m_secrets.find(record_id);
    if (it == m_secrets.end()) {
        Log::warning("InMemoryDocumentStore: No secret record '{}'", record_id);
        return std::unexpected(VaultError::StoreWriteFailed);
    }
    it->second = encrypted_secret;
    ++m_update_count;
    return {};
}

void InMemoryDocumentStore::put_secret(const std::string& record_id, const std::string& encrypted_secret) {
    std::lock_guard lock(m_mutex);
    m_secrets[record_id] = encrypted_secret;
}

std::optional<std::string> InMemoryDocumentStore::get_secret(const std::string& record_id) const {
    std::lock_guard lock(m_mutex);
    auto it = m_secrets.find(record_id);
    if (it == m_secrets.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<SecretRecord> InMemoryDocumentStore::secret_records() const {
    std::lock_guard lock(m_mutex);
    std::vector<SecretRecord> records;
    records.reserve(m_secrets.size());
    for (const auto& [id, blob] : m_secrets) {
        SecretRecord record;
        record.id = id;
        record.encrypted_secret = blob;
        records.push_back(std::move(record));
    }
    return records;
}

size_t InMemoryDocumentStore::update_count() const {
    std::lock_guard lock(m_mutex);
    return m_update_count;
}

} // namespace SuperLocker
