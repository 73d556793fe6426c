// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

#include "PasswordGenerator.h"
#include "../../utils/Log.h"
#include <openssl/crypto.h>

namespace SuperLocker {

std::string PasswordGenerator::build_pool(const CharacterClasses& classes) {
    std::string pool;
    if (classes.upper) {
        pool += classes.exclude_similar ? UPPER_UNAMBIGUOUS : UPPER;
    }
    if (classes.lower) {
        pool += classes.exclude_similar ? LOWER_UNAMBIGUOUS : LOWER;
    }
    if (classes.digits) {
        pool += classes.exclude_similar ? DIGITS_UNAMBIGUOUS : DIGITS;
    }
    if (classes.symbols) {
        pool += SYMBOLS;
    }
    return pool;
}

VaultResult<std::string> PasswordGenerator::generate(size_t length,
                                                     const CharacterClasses& classes) const {
    if (length == 0) {
        return std::unexpected(VaultError::InvalidLength);
    }

    const std::string pool = build_pool(classes);
    if (pool.empty()) {
        return std::unexpected(VaultError::NoCharacterClasses);
    }

    std::string password;
    password.reserve(length);
    for (size_t i = 0; i < length; ++i) {
        auto index = m_random.uniform_index(pool.size());
        if (!index) {
            OPENSSL_cleanse(password.data(), password.size());
            return std::unexpected(index.error());
        }
        password += pool[*index];
    }

    Log::debug("PasswordGenerator: Generated {}-character password from a pool of {}",
               length, pool.size());
    return password;
}

} // namespace SuperLocker
