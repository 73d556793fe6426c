// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

#pragma once

#include "../VaultError.h"
#include "../VaultKey.h"
#include "../format/SecretCodec.h"
#include "../../utils/SecureMemory.h"
#include <string>
#include <vector>

namespace SuperLocker {

/**
 * @class BatchDecryptor
 * @brief Decrypts many current-format blobs in fixed-size parallel batches
 *
 * Each batch is fanned out with std::async and joined before the next one
 * starts, so at most batch_size decryptions run at once. Results come back
 * in input order and one failing blob does not affect the others.
 */
class BatchDecryptor {
public:
    static constexpr size_t DEFAULT_BATCH_SIZE = 5;

    explicit BatchDecryptor(SecretCodec codec = SecretCodec{},
                            size_t batch_size = DEFAULT_BATCH_SIZE);

    /**
     * @param blobs Base64 ciphertext blobs
     * @param vault_key Held for the whole call; a concurrent lock() does not
     *                  invalidate it
     * @return One result per blob, same order; VaultLocked for every entry
     *         when @p vault_key is null
     */
    [[nodiscard]] std::vector<VaultResult<SecureString>> decrypt_batch(
        const std::vector<std::string>& blobs,
        VaultKeyHandle vault_key) const;

    [[nodiscard]] size_t batch_size() const noexcept { return m_batch_size; }

private:
    SecretCodec m_codec;
    size_t m_batch_size;
};

} // namespace SuperLocker
