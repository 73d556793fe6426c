// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

/**
 * @file SecureMemory.h
 * @brief Zeroizing containers and OpenSSL RAII handles
 *
 * Every buffer that holds a secret, a derived key or decrypted plaintext
 * lives in one of the types below so that it is overwritten with
 * OPENSSL_cleanse() before its memory is released.
 */

#ifndef SUPERLOCKER_SECURE_MEMORY_H
#define SUPERLOCKER_SECURE_MEMORY_H

#include <array>
#include <cstdint>
#include <memory>
#include <vector>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <glibmm/ustring.h>

namespace SuperLocker {

struct EVPCipherContextDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const {
        if (ctx) {
            EVP_CIPHER_CTX_free(ctx);
        }
    }
};

struct EVPMDContextDeleter {
    void operator()(EVP_MD_CTX* ctx) const {
        if (ctx) {
            EVP_MD_CTX_free(ctx);
        }
    }
};

/** @brief Owning handle for an EVP cipher context */
using EVPCipherContextPtr = std::unique_ptr<EVP_CIPHER_CTX, EVPCipherContextDeleter>;

/** @brief Owning handle for an EVP digest context */
using EVPMDContextPtr = std::unique_ptr<EVP_MD_CTX, EVPMDContextDeleter>;

/**
 * @brief Allocator that cleanses memory before handing it back
 *
 * @tparam T Element type (uint8_t for key material, char for text)
 */
template<typename T>
class SecureAllocator : public std::allocator<T> {
public:
    template<typename U>
    struct rebind {
        using other = SecureAllocator<U>;
    };

    SecureAllocator() noexcept = default;

    template<typename U>
    SecureAllocator(const SecureAllocator<U>&) noexcept {}

    void deallocate(T* p, std::size_t n) {
        if (p) {
            OPENSSL_cleanse(p, n * sizeof(T));
            std::allocator<T>::deallocate(p, n);
        }
    }
};

template<typename T, typename U>
bool operator==(const SecureAllocator<T>&, const SecureAllocator<U>&) noexcept { return true; }

/**
 * @brief std::vector whose storage is cleansed on every reallocation and on destruction
 *
 * @code
 * SecureVector<uint8_t> master_key(32);
 * // ... derive into master_key.data() ...
 * // zeroed when master_key goes out of scope
 * @endcode
 */
template<typename T>
using SecureVector = std::vector<T, SecureAllocator<T>>;

/**
 * @brief Securely clear a fixed-size byte array
 */
template<size_t N>
inline void secure_clear(std::array<uint8_t, N>& arr) {
    OPENSSL_cleanse(arr.data(), arr.size());
}

/**
 * @brief Securely clear a vector's contents and empty it
 */
template<typename Alloc>
inline void secure_clear(std::vector<uint8_t, Alloc>& vec) {
    if (!vec.empty()) {
        OPENSSL_cleanse(vec.data(), vec.size());
        vec.clear();
    }
}

/**
 * @brief Overwrite and empty a Glib::ustring holding a password
 */
inline void secure_clear_ustring(Glib::ustring& str) {
    if (!str.empty()) {
        OPENSSL_cleanse(const_cast<char*>(str.data()), str.bytes());
        str.clear();
    }
}

/**
 * @brief Move-only owner of secret text (master passwords, decrypted entries)
 *
 * Cleansed on destruction and on move. Decrypted record plaintext is handed
 * out in this type so callers cannot forget to wipe it.
 */
class SecureString {
public:
    SecureString() = default;

    explicit SecureString(Glib::ustring str) : str_(std::move(str)) {}

    ~SecureString() {
        secure_clear_ustring(str_);
    }

    SecureString(const SecureString&) = delete;
    SecureString& operator=(const SecureString&) = delete;

    SecureString(SecureString&& other) noexcept
        : str_(std::move(other.str_)) {
        secure_clear_ustring(other.str_);
    }

    SecureString& operator=(SecureString&& other) noexcept {
        if (this != &other) {
            secure_clear_ustring(str_);
            str_ = std::move(other.str_);
            secure_clear_ustring(other.str_);
        }
        return *this;
    }

    [[nodiscard]] const Glib::ustring& get() const noexcept {
        return str_;
    }

    void clear() noexcept {
        secure_clear_ustring(str_);
    }

    [[nodiscard]] bool empty() const noexcept {
        return str_.empty();
    }

    /** @brief Size in bytes (UTF-8) */
    [[nodiscard]] size_t bytes() const noexcept {
        return str_.bytes();
    }

private:
    Glib::ustring str_;
};

} // namespace SuperLocker

#endif // SUPERLOCKER_SECURE_MEMORY_H
