// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

#include "CryptoSettings.h"
#include <algorithm>

namespace SuperLocker {

CryptoSettings CryptoSettings::from_settings(const Glib::RefPtr<Gio::Settings>& settings) {
    CryptoSettings result;
    if (!settings) {
        return result;
    }

    const Glib::ustring algorithm = settings->get_string("kdf-algorithm");
    if (auto parsed = algorithm_from_string(algorithm.raw())) {
        result.kdf_algorithm = *parsed;
    } else {
        Log::warning("CryptoSettings: Unknown kdf-algorithm '{}', using {}",
                     algorithm.raw(), algorithm_to_string(result.kdf_algorithm));
    }

    result.pbkdf2_iterations = settings->get_uint("pbkdf2-iterations");
    result.argon2_memory_kb = settings->get_uint("argon2-memory-kb");
    result.argon2_iterations = settings->get_uint("argon2-iterations");
    result.argon2_parallelism = settings->get_uint("argon2-parallelism");
    result.decrypt_batch_size = settings->get_uint("decrypt-batch-size");
    result.generator_default_length = settings->get_uint("generator-default-length");
    result.generator_exclude_similar = settings->get_boolean("generator-exclude-similar");
    result.log_level = Log::level_from_string(settings->get_string("log-level").raw());

    result.clamp();
    return result;
}

void CryptoSettings::clamp() {
    pbkdf2_iterations = std::clamp(pbkdf2_iterations, MIN_PBKDF2_ITERATIONS, MAX_PBKDF2_ITERATIONS);
    argon2_memory_kb = std::clamp(argon2_memory_kb, MIN_ARGON2_MEMORY_KB, MAX_ARGON2_MEMORY_KB);
    argon2_iterations = std::clamp(argon2_iterations, MIN_ARGON2_ITERATIONS, MAX_ARGON2_ITERATIONS);
    argon2_parallelism = std::clamp(argon2_parallelism, MIN_ARGON2_PARALLELISM, MAX_ARGON2_PARALLELISM);
    decrypt_batch_size = std::clamp(decrypt_batch_size, MIN_BATCH_SIZE, MAX_BATCH_SIZE);
    generator_default_length = std::clamp(generator_default_length, MIN_GENERATOR_LENGTH, MAX_GENERATOR_LENGTH);
}

KdfParameters CryptoSettings::kdf_parameters() const {
    KdfParameters params;
    params.pbkdf2_iterations = pbkdf2_iterations;
    params.argon2_memory_kb = argon2_memory_kb;
    params.argon2_time_cost = argon2_iterations;
    params.argon2_parallelism = argon2_parallelism;
    return params;
}

CharacterClasses CryptoSettings::generator_classes() const {
    CharacterClasses classes;
    classes.exclude_similar = generator_exclude_similar;
    return classes;
}

void CryptoSettings::apply_log_level() const {
    Log::set_level(log_level);
}

} // namespace SuperLocker
