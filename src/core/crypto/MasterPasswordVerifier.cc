// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

#include "MasterPasswordVerifier.h"
#include "../../utils/Base64.h"
#include "../../utils/Log.h"
#include "../../utils/SecureMemory.h"
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <algorithm>

namespace SuperLocker {

VaultResult<MasterPasswordVerifier::Hash> MasterPasswordVerifier::compute(const Glib::ustring& password) {
    EVPMDContextPtr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        Log::error("MasterPasswordVerifier: Failed to create digest context");
        return std::unexpected(VaultError::KeyDerivationError);
    }

    Hash hash{};
    unsigned int hash_len = 0;
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), password.data(), password.bytes()) != 1 ||
        EVP_DigestUpdate(ctx.get(), VERIFIER_SALT.data(), VERIFIER_SALT.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), hash.data(), &hash_len) != 1 ||
        hash_len != HASH_LENGTH) {
        Log::error("MasterPasswordVerifier: SHA-256 digest failed");
        secure_clear(hash);
        return std::unexpected(VaultError::KeyDerivationError);
    }

    return hash;
}

bool MasterPasswordVerifier::verify(const Glib::ustring& password,
                                    std::span<const uint8_t> stored) {
    if (stored.size() != HASH_LENGTH) {
        return false;
    }

    auto computed = compute(password);
    if (!computed) {
        return false;
    }

    const bool match = CRYPTO_memcmp(computed->data(), stored.data(), HASH_LENGTH) == 0;
    secure_clear(*computed);
    return match;
}

bool MasterPasswordVerifier::verify_encoded(const Glib::ustring& password,
                                            std::string_view stored) {
    auto decoded = Base64::decode(stored);
    if (!decoded) {
        return false;
    }
    return verify(password, *decoded);
}

std::string MasterPasswordVerifier::to_base64(const Hash& hash) {
    return Base64::encode(hash);
}

VaultResult<MasterPasswordVerifier::Hash> MasterPasswordVerifier::from_base64(std::string_view encoded) {
    auto decoded = Base64::decode(encoded);
    if (!decoded) {
        return std::unexpected(decoded.error());
    }
    if (decoded->size() != HASH_LENGTH) {
        return std::unexpected(VaultError::InvalidFormat);
    }

    Hash hash{};
    std::copy(decoded->begin(), decoded->end(), hash.begin());
    return hash;
}

} // namespace SuperLocker
