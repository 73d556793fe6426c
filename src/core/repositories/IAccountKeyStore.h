// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

/**
 * @file IAccountKeyStore.h
 * @brief Persistence collaborators consumed by the envelope-encryption core
 *
 * The concrete backing store (a cloud document database in the shipping
 * application) is outside this library. The core only needs to read and
 * write one key document per account and to replace one secret blob per
 * record; these interfaces are that surface.
 */

#pragma once

#include "../AccountKeyRecord.h"
#include "../VaultError.h"
#include <optional>
#include <string>

namespace SuperLocker {

/**
 * @brief Reads and writes the per-account key document
 *
 * Implementations report transport problems as StoreReadFailed or
 * StoreWriteFailed. A missing document is not an error: get() returns
 * std::nullopt.
 */
class IAccountKeyStore {
public:
    virtual ~IAccountKeyStore() = default;

    [[nodiscard]] virtual VaultResult<std::optional<Document>>
    get(const std::string& account_id) = 0;

    [[nodiscard]] virtual VaultResult<void>
    put(const std::string& account_id, const Document& document) = 0;
};

/**
 * @brief Replaces the ciphertext blob of a single stored secret
 *
 * Each call is independent; there is no batch transaction.
 */
class ISecretRecordStore {
public:
    virtual ~ISecretRecordStore() = default;

    [[nodiscard]] virtual VaultResult<void>
    update_secret(const std::string& record_id, const std::string& encrypted_secret) = 0;
};

} // namespace SuperLocker
