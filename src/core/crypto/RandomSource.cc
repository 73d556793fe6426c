// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

#include "RandomSource.h"
#include "../../utils/Log.h"
#include <openssl/crypto.h>
#include <openssl/rand.h>
#include <limits>

namespace SuperLocker {

VaultResult<std::vector<uint8_t>> IRandomSource::bytes(size_t length) {
    std::vector<uint8_t> out(length);
    if (auto result = fill(out); !result) {
        return std::unexpected(result.error());
    }
    return out;
}

VaultResult<size_t> IRandomSource::uniform_index(size_t bound) {
    if (bound == 0 || bound > std::numeric_limits<uint32_t>::max()) {
        return std::unexpected(VaultError::RandomGenerationFailed);
    }

    const uint64_t range = uint64_t{1} << 32;
    // Largest multiple of bound that fits in 32 bits; draws above it are retried
    const uint64_t limit = range - (range % bound);

    for (;;) {
        uint8_t buf[4];
        if (auto result = fill(buf); !result) {
            return std::unexpected(result.error());
        }
        const uint64_t value = (uint64_t{buf[0]} << 24) | (uint64_t{buf[1]} << 16) |
                               (uint64_t{buf[2]} << 8) | uint64_t{buf[3]};
        OPENSSL_cleanse(buf, sizeof(buf));
        if (value < limit) {
            return static_cast<size_t>(value % bound);
        }
    }
}

VaultResult<void> OpenSslRandomSource::fill(std::span<uint8_t> out) {
    if (out.empty()) {
        return {};
    }
    if (out.size() > static_cast<size_t>(std::numeric_limits<int>::max()) ||
        RAND_bytes(out.data(), static_cast<int>(out.size())) != 1) {
        // Never hand back a partially filled buffer
        OPENSSL_cleanse(out.data(), out.size());
        Log::error("RandomSource: RAND_bytes failed for {} bytes", out.size());
        return std::unexpected(VaultError::RandomGenerationFailed);
    }
    return {};
}

OpenSslRandomSource& OpenSslRandomSource::instance() {
    static OpenSslRandomSource source;
    return source;
}

} // namespace SuperLocker
