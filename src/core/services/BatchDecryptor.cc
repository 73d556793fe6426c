// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

#include "BatchDecryptor.h"
#include "../../utils/Log.h"
#include <algorithm>
#include <future>
#include <utility>

namespace SuperLocker {

BatchDecryptor::BatchDecryptor(SecretCodec codec, size_t batch_size)
    : m_codec(std::move(codec)),
      m_batch_size(std::max<size_t>(batch_size, 1)) {}

std::vector<VaultResult<SecureString>> BatchDecryptor::decrypt_batch(
    const std::vector<std::string>& blobs,
    VaultKeyHandle vault_key) const {

    std::vector<VaultResult<SecureString>> results;
    results.reserve(blobs.size());

    if (!vault_key) {
        for (size_t i = 0; i < blobs.size(); ++i) {
            results.emplace_back(std::unexpected(VaultError::VaultLocked));
        }
        return results;
    }

    for (size_t start = 0; start < blobs.size(); start += m_batch_size) {
        const size_t end = std::min(start + m_batch_size, blobs.size());

        std::vector<std::future<VaultResult<SecureString>>> pending;
        pending.reserve(end - start);
        for (size_t i = start; i < end; ++i) {
            pending.push_back(std::async(std::launch::async,
                [this, &blob = blobs[i], key = vault_key]() {
                    return m_codec.decode_current(blob, *key);
                }));
        }

        for (auto& future : pending) {
            results.push_back(future.get());
        }
    }

    const auto failed = std::count_if(results.begin(), results.end(),
        [](const auto& result) { return !result.has_value(); });
    Log::debug("BatchDecryptor: Decrypted {} blobs ({} failed)", blobs.size(), failed);

    return results;
}

} // namespace SuperLocker
