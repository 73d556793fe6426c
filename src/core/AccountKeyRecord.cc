// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

#include "AccountKeyRecord.h"
#include "../utils/Base64.h"
#include "../utils/Log.h"
#include <algorithm>
#include <charconv>
#include <optional>

namespace SuperLocker {

namespace {

constexpr const char* KEY_SALT = "salt";
constexpr const char* KEY_IV = "vaultKeyIV";
constexpr const char* KEY_WRAPPED = "encryptedVaultKey";
constexpr const char* KEY_KDF = "kdf";
constexpr const char* KEY_ITERATIONS = "iterations";
constexpr const char* KEY_ARGON2_MEMORY = "argon2MemoryKb";
constexpr const char* KEY_ARGON2_PARALLELISM = "argon2Parallelism";

std::optional<uint32_t> parse_u32(const std::string& text) {
    uint32_t value = 0;
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc{} || ptr != end || text.empty()) {
        return std::nullopt;
    }
    return value;
}

bool in_range(const std::optional<uint32_t>& value, uint32_t max) {
    return value && *value != 0 && *value <= max;
}

template<size_t N>
bool decode_fixed(const Document& doc, const char* key, std::array<uint8_t, N>& out) {
    auto it = doc.find(key);
    if (it == doc.end()) {
        Log::error("AccountKeyRecord: Missing field '{}'", key);
        return false;
    }
    auto bytes = Base64::decode(it->second);
    if (!bytes || bytes->size() != N) {
        Log::error("AccountKeyRecord: Field '{}' is not {} base64 bytes", key, N);
        return false;
    }
    std::copy(bytes->begin(), bytes->end(), out.begin());
    return true;
}

} // namespace

KdfParameters AccountKeyRecord::kdf_parameters() const {
    KdfParameters params;
    if (kdf_algorithm == KdfAlgorithm::ARGON2ID) {
        params.argon2_time_cost = iterations;
        params.argon2_memory_kb = argon2_memory_kb;
        params.argon2_parallelism = argon2_parallelism;
    } else {
        params.pbkdf2_iterations = iterations;
    }
    return params;
}

Document AccountKeyRecord::to_document() const {
    Document doc;
    doc[KEY_SALT] = Base64::encode(salt);
    doc[KEY_IV] = Base64::encode(vault_key_iv);
    doc[KEY_WRAPPED] = Base64::encode(encrypted_vault_key);
    doc[KEY_KDF] = std::string(algorithm_to_string(kdf_algorithm));
    doc[KEY_ITERATIONS] = std::to_string(iterations);
    if (kdf_algorithm == KdfAlgorithm::ARGON2ID) {
        doc[KEY_ARGON2_MEMORY] = std::to_string(argon2_memory_kb);
        doc[KEY_ARGON2_PARALLELISM] = std::to_string(argon2_parallelism);
    }
    return doc;
}

VaultResult<AccountKeyRecord> AccountKeyRecord::from_document(const Document& doc) {
    AccountKeyRecord record;

    if (!decode_fixed(doc, KEY_SALT, record.salt) ||
        !decode_fixed(doc, KEY_IV, record.vault_key_iv)) {
        return std::unexpected(VaultError::InvalidFormat);
    }

    auto wrapped_it = doc.find(KEY_WRAPPED);
    if (wrapped_it == doc.end()) {
        Log::error("AccountKeyRecord: Missing field '{}'", KEY_WRAPPED);
        return std::unexpected(VaultError::InvalidFormat);
    }
    auto wrapped = Base64::decode(wrapped_it->second);
    if (!wrapped || wrapped->empty()) {
        Log::error("AccountKeyRecord: Field '{}' is not valid base64", KEY_WRAPPED);
        return std::unexpected(VaultError::InvalidFormat);
    }
    record.encrypted_vault_key = std::move(*wrapped);

    if (auto it = doc.find(KEY_KDF); it != doc.end()) {
        auto algorithm = algorithm_from_string(it->second);
        if (!algorithm) {
            Log::error("AccountKeyRecord: Unknown KDF '{}'", it->second);
            return std::unexpected(VaultError::InvalidFormat);
        }
        record.kdf_algorithm = *algorithm;
    }

    if (auto it = doc.find(KEY_ITERATIONS); it != doc.end()) {
        const uint32_t max_iterations = record.kdf_algorithm == KdfAlgorithm::ARGON2ID
            ? KdfParameters::MAX_ARGON2_TIME_COST
            : KdfParameters::MAX_PBKDF2_ITERATIONS;
        auto value = parse_u32(it->second);
        if (!value || *value == 0 || *value > max_iterations) {
            Log::error("AccountKeyRecord: Invalid iteration count");
            return std::unexpected(VaultError::InvalidFormat);
        }
        record.iterations = *value;
    }

    if (record.kdf_algorithm == KdfAlgorithm::ARGON2ID) {
        auto mem_it = doc.find(KEY_ARGON2_MEMORY);
        auto par_it = doc.find(KEY_ARGON2_PARALLELISM);
        if (mem_it == doc.end() || par_it == doc.end()) {
            Log::error("AccountKeyRecord: Argon2id record without cost parameters");
            return std::unexpected(VaultError::InvalidFormat);
        }
        auto memory = parse_u32(mem_it->second);
        auto parallelism = parse_u32(par_it->second);
        if (!in_range(memory, KdfParameters::MAX_ARGON2_MEMORY_KB) ||
            !in_range(parallelism, KdfParameters::MAX_ARGON2_PARALLELISM)) {
            Log::error("AccountKeyRecord: Argon2id cost parameters out of range");
            return std::unexpected(VaultError::InvalidFormat);
        }
        record.argon2_memory_kb = *memory;
        record.argon2_parallelism = *parallelism;
    }

    return record;
}

} // namespace SuperLocker
