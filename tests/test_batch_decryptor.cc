// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

#include <gtest/gtest.h>
#include "../src/core/services/BatchDecryptor.h"
#include <openssl/rand.h>

using namespace SuperLocker;

class BatchDecryptorTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::array<uint8_t, VaultKey::LENGTH> raw{};
        RAND_bytes(raw.data(), static_cast<int>(raw.size()));
        vault_key = std::make_shared<const VaultKey>(raw);

        for (int i = 0; i < 23; ++i) {
            const std::string plaintext = "entry #" + std::to_string(i);
            auto blob = codec.encode_current(plaintext, *vault_key);
            ASSERT_TRUE(blob.has_value());
            blobs.push_back(*blob);
            plaintexts.push_back(plaintext);
        }
    }

    SecretCodec codec;
    VaultKeyHandle vault_key;
    std::vector<std::string> blobs;
    std::vector<std::string> plaintexts;
};

TEST_F(BatchDecryptorTest, ResultsKeepInputOrder) {
    BatchDecryptor decryptor(codec, 5);
    auto results = decryptor.decrypt_batch(blobs, vault_key);

    ASSERT_EQ(results.size(), blobs.size());
    for (size_t i = 0; i < results.size(); ++i) {
        ASSERT_TRUE(results[i].has_value()) << "index " << i;
        EXPECT_EQ(results[i]->get().raw(), plaintexts[i]);
    }
}

TEST_F(BatchDecryptorTest, BatchSizeDoesNotChangeResults) {
    for (size_t batch_size : {1u, 4u, 64u}) {
        BatchDecryptor decryptor(codec, batch_size);
        auto results = decryptor.decrypt_batch(blobs, vault_key);
        ASSERT_EQ(results.size(), blobs.size());
        for (size_t i = 0; i < results.size(); ++i) {
            ASSERT_TRUE(results[i].has_value());
            EXPECT_EQ(results[i]->get().raw(), plaintexts[i]);
        }
    }
}

TEST_F(BatchDecryptorTest, FailuresAreIsolated) {
    blobs[3] = "garbage!";
    blobs[7] = blobs[7].substr(0, 8);

    BatchDecryptor decryptor(codec);
    auto results = decryptor.decrypt_batch(blobs, vault_key);

    ASSERT_EQ(results.size(), blobs.size());
    EXPECT_FALSE(results[3].has_value());
    EXPECT_FALSE(results[7].has_value());
    for (size_t i = 0; i < results.size(); ++i) {
        if (i == 3 || i == 7) {
            continue;
        }
        ASSERT_TRUE(results[i].has_value());
        EXPECT_EQ(results[i]->get().raw(), plaintexts[i]);
    }
}

TEST_F(BatchDecryptorTest, NullKeyReportsLocked) {
    BatchDecryptor decryptor(codec);
    auto results = decryptor.decrypt_batch(blobs, nullptr);

    ASSERT_EQ(results.size(), blobs.size());
    for (const auto& result : results) {
        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error(), VaultError::VaultLocked);
    }
}

TEST_F(BatchDecryptorTest, EmptyInput) {
    BatchDecryptor decryptor(codec);
    EXPECT_TRUE(decryptor.decrypt_batch({}, vault_key).empty());
}

TEST_F(BatchDecryptorTest, ZeroBatchSizeIsRaisedToOne) {
    BatchDecryptor decryptor(codec, 0);
    EXPECT_EQ(decryptor.batch_size(), 1u);
    EXPECT_EQ(decryptor.decrypt_batch(blobs, vault_key).size(), blobs.size());
}
