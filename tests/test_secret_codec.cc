// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

/**
 * @file test_secret_codec.cc
 * @brief Tests for blob layouts, format detection and legacy decoding
 */

#include <gtest/gtest.h>
#include "../src/core/format/SecretCodec.h"
#include "../src/utils/Base64.h"
#include <openssl/rand.h>
#include <set>

using namespace SuperLocker;

namespace {

class FailingRandomSource final : public IRandomSource {
public:
    VaultResult<void> fill(std::span<uint8_t>) override {
        return std::unexpected(VaultError::RandomGenerationFailed);
    }
};

} // namespace

// ============================================================================
// Test Fixture
// ============================================================================

class SecretCodecTest : public ::testing::Test {
protected:
    static constexpr uint32_t FAST_ITERATIONS = 1000;

    void SetUp() override {
        std::array<uint8_t, VaultKey::LENGTH> raw{};
        RAND_bytes(raw.data(), static_cast<int>(raw.size()));
        vault_key = std::make_shared<const VaultKey>(raw);
        RAND_bytes(raw.data(), static_cast<int>(raw.size()));
        other_key = std::make_shared<const VaultKey>(raw);
    }

    // iv ‖ ciphertext with no tag, as written before tags existed
    std::string make_untagged(const std::string& plaintext) {
        AesCbcCipher cipher;
        auto iv = generate_iv(OpenSslRandomSource::instance());
        EXPECT_TRUE(iv.has_value());
        std::vector<uint8_t> data(plaintext.begin(), plaintext.end());
        auto ct = cipher.encrypt(data, vault_key->bytes(), *iv);
        EXPECT_TRUE(ct.has_value());

        std::vector<uint8_t> blob(iv->begin(), iv->end());
        blob.insert(blob.end(), ct->begin(), ct->end());
        return Base64::encode(blob);
    }

    SecretCodec codec{OpenSslRandomSource::instance(), nullptr, FAST_ITERATIONS};
    VaultKeyHandle vault_key;
    VaultKeyHandle other_key;
};

// ============================================================================
// Current layout
// ============================================================================

TEST_F(SecretCodecTest, RoundTripsVariedPlaintexts) {
    const std::vector<Glib::ustring> samples = {
        "", "a", "hunter2", "exactly sixteen!", "ünïcødé pässwörd ✓",
        Glib::ustring(200, 'x')
    };

    for (const auto& plaintext : samples) {
        auto blob = codec.encode_current(plaintext, *vault_key);
        ASSERT_TRUE(blob.has_value());

        auto decoded = codec.decode_current(*blob, *vault_key);
        ASSERT_TRUE(decoded.has_value()) << plaintext.raw();
        EXPECT_EQ(decoded->get(), plaintext);
    }
}

TEST_F(SecretCodecTest, EncodingIsNonDeterministic) {
    std::set<std::string> blobs;
    for (int i = 0; i < 10; ++i) {
        auto blob = codec.encode_current("same plaintext", *vault_key);
        ASSERT_TRUE(blob.has_value());
        blobs.insert(*blob);
    }
    EXPECT_EQ(blobs.size(), 10u);
}

TEST_F(SecretCodecTest, NewBlobsCarryFormatTag) {
    auto blob = codec.encode_current("tagged", *vault_key);
    ASSERT_TRUE(blob.has_value());

    auto bytes = Base64::decode(*blob);
    ASSERT_TRUE(bytes.has_value());
    EXPECT_EQ(bytes->front(), SecretCodec::FORMAT_TAG_VAULT_KEY);
    EXPECT_EQ(bytes->size(), 1 + 16 + 16u);
    EXPECT_EQ(SecretCodec::detect_format(*blob), BlobFormat::Current);
}

TEST_F(SecretCodecTest, LongPlaintextStillDetectedAsCurrent) {
    auto blob = codec.encode_current(Glib::ustring(100, 'z'), *vault_key);
    ASSERT_TRUE(blob.has_value());
    EXPECT_EQ(SecretCodec::detect_format(*blob), BlobFormat::Current);
    EXPECT_FALSE(SecretCodec::is_legacy_format(*blob));
}

TEST_F(SecretCodecTest, WrongKeyFails) {
    auto blob = codec.encode_current("secret value", *vault_key);
    ASSERT_TRUE(blob.has_value());

    auto decoded = codec.decode_current(*blob, *other_key);
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error(), VaultError::DecryptionFailed);
}

TEST_F(SecretCodecTest, DecodeRejectsMalformedInput) {
    auto not_base64 = codec.decode_current("***not base64***", *vault_key);
    ASSERT_FALSE(not_base64.has_value());
    EXPECT_EQ(not_base64.error(), VaultError::InvalidFormat);

    // 8 bytes: shorter than an IV
    auto too_short = codec.decode_current(Base64::encode(std::vector<uint8_t>(8, 0x01)), *vault_key);
    ASSERT_FALSE(too_short.has_value());
    EXPECT_EQ(too_short.error(), VaultError::InvalidFormat);

    // IV only, no ciphertext
    auto iv_only = codec.decode_current(Base64::encode(std::vector<uint8_t>(16, 0x01)), *vault_key);
    ASSERT_FALSE(iv_only.has_value());
    EXPECT_EQ(iv_only.error(), VaultError::DecryptionFailed);
}

TEST_F(SecretCodecTest, EncodeReportsRandomFailure) {
    FailingRandomSource failing;
    SecretCodec broken(failing, nullptr, FAST_ITERATIONS);

    auto blob = broken.encode_current("x", *vault_key);
    ASSERT_FALSE(blob.has_value());
    EXPECT_EQ(blob.error(), VaultError::RandomGenerationFailed);
}

// ============================================================================
// Untagged current layout
// ============================================================================

TEST_F(SecretCodecTest, UntaggedCurrentBlobDecodes) {
    const std::string blob = make_untagged("old current");

    EXPECT_EQ(SecretCodec::detect_format(blob), BlobFormat::UntaggedCurrent);
    auto decoded = codec.decode_current(blob, *vault_key);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->get(), "old current");
}

TEST_F(SecretCodecTest, LongUntaggedCurrentBlobIsAmbiguous) {
    // 40-byte plaintext -> 16 + 48 = 64 bytes, the legacy minimum
    const std::string blob = make_untagged(std::string(40, 'q'));

    EXPECT_EQ(SecretCodec::detect_format(blob), BlobFormat::Legacy);
    auto decoded = codec.decode_current(blob, *vault_key);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->get().raw(), std::string(40, 'q'));
}

// ============================================================================
// Legacy layout
// ============================================================================

TEST_F(SecretCodecTest, LegacyRoundTrip) {
    auto blob = codec.encode_legacy("legacy secret", "master pw");
    ASSERT_TRUE(blob.has_value());

    auto bytes = Base64::decode(*blob);
    ASSERT_TRUE(bytes.has_value());
    EXPECT_EQ(bytes->size(), 32 + 16 + 16u);
    EXPECT_EQ(SecretCodec::detect_format(*blob), BlobFormat::Legacy);
    EXPECT_TRUE(SecretCodec::is_legacy_format(*blob));

    auto decoded = codec.decode_legacy(*blob, "master pw");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->get(), "legacy secret");
}

TEST_F(SecretCodecTest, LegacyWrongSecretFails) {
    auto blob = codec.encode_legacy("legacy secret", "master pw");
    ASSERT_TRUE(blob.has_value());

    auto decoded = codec.decode_legacy(*blob, "other pw");
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error(), VaultError::DecryptionFailed);
}

TEST_F(SecretCodecTest, LegacyRejectsShortBlob) {
    auto decoded = codec.decode_legacy(Base64::encode(std::vector<uint8_t>(47, 0x33)), "master pw");
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error(), VaultError::InvalidFormat);
}

TEST_F(SecretCodecTest, LegacyRejectsEmptySecret) {
    auto blob = codec.encode_legacy("legacy secret", "master pw");
    ASSERT_TRUE(blob.has_value());

    auto decoded = codec.decode_legacy(*blob, "");
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error(), VaultError::KeyDerivationError);
}

TEST_F(SecretCodecTest, LegacyBlobIsNotReadableWithVaultKey) {
    auto blob = codec.encode_legacy("legacy secret", "master pw");
    ASSERT_TRUE(blob.has_value());
    EXPECT_FALSE(codec.decode_current(*blob, *vault_key).has_value());
}

// ============================================================================
// Detection edge cases
// ============================================================================

TEST_F(SecretCodecTest, DetectsInvalidBlobs) {
    EXPECT_EQ(SecretCodec::detect_format(""), BlobFormat::Invalid);
    EXPECT_EQ(SecretCodec::detect_format("%%%%"), BlobFormat::Invalid);
    EXPECT_EQ(SecretCodec::detect_format(Base64::encode(std::vector<uint8_t>(16, 0))), BlobFormat::Invalid);
    EXPECT_EQ(SecretCodec::detect_format(Base64::encode(std::vector<uint8_t>(33, 0))), BlobFormat::Invalid);

    // Tag plus IV but no ciphertext block
    std::vector<uint8_t> tag_and_iv(17, 0);
    tag_and_iv[0] = SecretCodec::FORMAT_TAG_VAULT_KEY;
    EXPECT_EQ(SecretCodec::detect_format(Base64::encode(tag_and_iv)), BlobFormat::Invalid);
}

TEST_F(SecretCodecTest, FormatNames) {
    EXPECT_EQ(to_string(BlobFormat::Current), "current");
    EXPECT_EQ(to_string(BlobFormat::UntaggedCurrent), "untagged-current");
    EXPECT_EQ(to_string(BlobFormat::Legacy), "legacy");
    EXPECT_EQ(to_string(BlobFormat::Invalid), "invalid");
}
