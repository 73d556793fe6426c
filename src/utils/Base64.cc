// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

#include "Base64.h"
#include <openssl/evp.h>

namespace SuperLocker::Base64 {

namespace {

bool is_alphabet(char c) noexcept {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
           (c >= '0' && c <= '9') || c == '+' || c == '/';
}

} // namespace

std::string encode(std::span<const uint8_t> data) {
    if (data.empty()) {
        return {};
    }

    // EVP_EncodeBlock writes 4 chars per 3-byte group plus a NUL
    std::string out(4 * ((data.size() + 2) / 3) + 1, '\0');
    const int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                        data.data(), static_cast<int>(data.size()));
    out.resize(static_cast<size_t>(written));
    return out;
}

VaultResult<std::vector<uint8_t>> decode(std::string_view text) {
    if (text.empty()) {
        return std::vector<uint8_t>{};
    }
    if (text.size() % 4 != 0) {
        return std::unexpected(VaultError::InvalidFormat);
    }

    size_t padding = 0;
    if (text.back() == '=') {
        ++padding;
        if (text[text.size() - 2] == '=') {
            ++padding;
        }
    }
    for (size_t i = 0; i < text.size() - padding; ++i) {
        if (!is_alphabet(text[i])) {
            return std::unexpected(VaultError::InvalidFormat);
        }
    }

    std::vector<uint8_t> out(3 * (text.size() / 4));
    const int decoded = EVP_DecodeBlock(out.data(),
                                        reinterpret_cast<const unsigned char*>(text.data()),
                                        static_cast<int>(text.size()));
    if (decoded < 0 || static_cast<size_t>(decoded) < padding) {
        return std::unexpected(VaultError::InvalidFormat);
    }

    // EVP_DecodeBlock counts padding positions as output bytes
    out.resize(static_cast<size_t>(decoded) - padding);
    return out;
}

} // namespace SuperLocker::Base64
