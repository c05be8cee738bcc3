// Copyright (c) 2019 EPI-ONE Core Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <gtest/gtest.h>

#include "bundle_codec.h"
#include "crypter.h"
#include "random.h"
#include "test_env.h"

#include <algorithm>

class TestCrypter : public testing::Test {
public:
    const TestFactory& fac = HDVaultTestEnvironment::GetFactory();
    const SecureString passphrase = fac.CreatePassphrase("correct horse battery staple");
    const SecureString wrong      = fac.CreatePassphrase("correct horse battery stapler");

    static google::protobuf::Value& Field(CryptoPayload& payload, const std::string& section, const std::string& key) {
        return payload.mutable_fields()->at(section).mutable_struct_value()->mutable_fields()->at(key);
    }

    static google::protobuf::Value& Param(CryptoPayload& payload, const std::string& section, const std::string& key) {
        return Field(payload, section, "params").mutable_struct_value()->mutable_fields()->at(key);
    }

    // flips the first hex digit
    static void Tamper(google::protobuf::Value& value) {
        std::string hex = value.string_value();
        hex[0]          = hex[0] == '0' ? '1' : '0';
        value.set_string_value(hex);
    }
};

TEST_F(TestCrypter, crypter_round_trip) {
    std::vector<unsigned char> salt(WALLET_CRYPTO_SALT_SIZE, 0x42);
    std::vector<unsigned char> iv(WALLET_CRYPTO_IV_SIZE, 0x24);
    SecureByte plaintext = fac.CreateSeed();

    Crypter crypter;
    EXPECT_FALSE(crypter.IsReady());
    ASSERT_TRUE(crypter.SetKeyFromPassphrase(passphrase, salt, TEST_KDF_ROUNDS));
    EXPECT_TRUE(crypter.IsReady());

    std::vector<unsigned char> ciphertext;
    ASSERT_TRUE(crypter.Encrypt(plaintext, iv, ciphertext));
    EXPECT_EQ(ciphertext.size() % 16, 0);
    EXPECT_GT(ciphertext.size(), plaintext.size());

    SecureByte decrypted;
    ASSERT_TRUE(crypter.Decrypt(ciphertext, iv, decrypted));
    EXPECT_EQ(decrypted, plaintext);

    std::vector<unsigned char> sum1, sum2;
    ASSERT_TRUE(crypter.Checksum(ciphertext, sum1));
    EXPECT_EQ(sum1.size(), 32);
    ciphertext[0] ^= 0x80;
    ASSERT_TRUE(crypter.Checksum(ciphertext, sum2));
    EXPECT_NE(sum1, sum2);

    crypter.CleanKey();
    EXPECT_FALSE(crypter.IsReady());
    EXPECT_FALSE(crypter.Encrypt(plaintext, iv, ciphertext));
}

TEST_F(TestCrypter, crypter_rejects_bad_parameters) {
    Crypter crypter;
    EXPECT_FALSE(crypter.SetKeyFromPassphrase(passphrase, std::vector<unsigned char>(8), TEST_KDF_ROUNDS));
    EXPECT_FALSE(crypter.SetKeyFromPassphrase(passphrase, std::vector<unsigned char>(WALLET_CRYPTO_SALT_SIZE), 0));
    EXPECT_FALSE(crypter.SetKeyFromPassphrase(passphrase, std::vector<unsigned char>(WALLET_CRYPTO_SALT_SIZE),
                                              MAX_KDF_ROUNDS + 1));
    EXPECT_FALSE(crypter.IsReady());
}

TEST_F(TestCrypter, keystore_payload_layout) {
    KeystoreEncryptor encryptor(TEST_KDF_ROUNDS);
    EXPECT_EQ(encryptor.Name(), "keystore");
    EXPECT_EQ(encryptor.Version(), 4);
    EXPECT_EQ(encryptor.GetRounds(), TEST_KDF_ROUNDS);

    CryptoPayload payload;
    ASSERT_TRUE(encryptor.Encrypt(fac.CreateSeed(), passphrase, payload));

    EXPECT_EQ(Field(payload, "kdf", "function").string_value(), "pbkdf2");
    EXPECT_EQ(Field(payload, "kdf", "message").string_value(), "");
    EXPECT_EQ(Param(payload, "kdf", "dklen").number_value(), 64);
    EXPECT_EQ(Param(payload, "kdf", "c").number_value(), TEST_KDF_ROUNDS);
    EXPECT_EQ(Param(payload, "kdf", "prf").string_value(), "hmac-sha256");
    EXPECT_EQ(Param(payload, "kdf", "salt").string_value().size(), 2 * WALLET_CRYPTO_SALT_SIZE);
    EXPECT_EQ(Field(payload, "checksum", "function").string_value(), "sha256");
    EXPECT_EQ(Field(payload, "checksum", "message").string_value().size(), 64);
    EXPECT_EQ(Field(payload, "cipher", "function").string_value(), "aes-256-cbc");
    EXPECT_EQ(Param(payload, "cipher", "iv").string_value().size(), 2 * WALLET_CRYPTO_IV_SIZE);

    std::string json;
    EXPECT_TRUE(RecordToJson(payload, json));
    EXPECT_NE(json.find("\"kdf\""), std::string::npos);
}

TEST_F(TestCrypter, keystore_round_trip) {
    KeystoreEncryptor encryptor(TEST_KDF_ROUNDS);
    auto secret = fac.CreateSeed();

    CryptoPayload payload;
    ASSERT_TRUE(encryptor.Encrypt(secret, passphrase, payload));

    SecureByte decrypted;
    ASSERT_TRUE(encryptor.Decrypt(payload, passphrase, decrypted));
    EXPECT_EQ(decrypted, secret);

    // fresh salt and iv every time
    CryptoPayload again;
    ASSERT_TRUE(encryptor.Encrypt(secret, passphrase, again));
    EXPECT_NE(Param(again, "kdf", "salt").string_value(), Param(payload, "kdf", "salt").string_value());

    // empty passphrases are allowed
    ASSERT_TRUE(encryptor.Encrypt(secret, SecureString(), payload));
    ASSERT_TRUE(encryptor.Decrypt(payload, SecureString(), decrypted));
    EXPECT_EQ(decrypted, secret);
}

TEST_F(TestCrypter, keystore_uses_stored_rounds) {
    KeystoreEncryptor writer(TEST_KDF_ROUNDS);
    KeystoreEncryptor reader(TEST_KDF_ROUNDS * 2);
    auto secret = fac.CreateSeed();

    CryptoPayload payload;
    ASSERT_TRUE(writer.Encrypt(secret, passphrase, payload));

    SecureByte decrypted;
    ASSERT_TRUE(reader.Decrypt(payload, passphrase, decrypted));
    EXPECT_EQ(decrypted, secret);
}

TEST_F(TestCrypter, keystore_wrong_passphrase) {
    KeystoreEncryptor encryptor(TEST_KDF_ROUNDS);
    CryptoPayload payload;
    ASSERT_TRUE(encryptor.Encrypt(fac.CreateSeed(), passphrase, payload));

    SecureByte decrypted;
    EXPECT_FALSE(encryptor.Decrypt(payload, wrong, decrypted));
    EXPECT_FALSE(encryptor.Decrypt(payload, SecureString(), decrypted));
}

TEST_F(TestCrypter, keystore_tamper_detection) {
    KeystoreEncryptor encryptor(TEST_KDF_ROUNDS);
    CryptoPayload payload;
    ASSERT_TRUE(encryptor.Encrypt(fac.CreateSeed(), passphrase, payload));
    SecureByte decrypted;

    auto tampered = payload;
    Tamper(Field(tampered, "cipher", "message"));
    EXPECT_FALSE(encryptor.Decrypt(tampered, passphrase, decrypted));

    tampered = payload;
    Tamper(Field(tampered, "checksum", "message"));
    EXPECT_FALSE(encryptor.Decrypt(tampered, passphrase, decrypted));

    tampered = payload;
    Tamper(Param(tampered, "kdf", "salt"));
    EXPECT_FALSE(encryptor.Decrypt(tampered, passphrase, decrypted));

    tampered = payload;
    Param(tampered, "kdf", "c").set_number_value(TEST_KDF_ROUNDS + 1);
    EXPECT_FALSE(encryptor.Decrypt(tampered, passphrase, decrypted));

    tampered = payload;
    Field(tampered, "cipher", "function").set_string_value("aes-128-ctr");
    EXPECT_FALSE(encryptor.Decrypt(tampered, passphrase, decrypted));

    tampered = payload;
    Param(tampered, "cipher", "iv").set_string_value("xyz");
    EXPECT_FALSE(encryptor.Decrypt(tampered, passphrase, decrypted));

    tampered = payload;
    tampered.mutable_fields()->erase("checksum");
    EXPECT_FALSE(encryptor.Decrypt(tampered, passphrase, decrypted));

    EXPECT_FALSE(encryptor.Decrypt(CryptoPayload(), passphrase, decrypted));

    ASSERT_TRUE(encryptor.Decrypt(payload, passphrase, decrypted));
}

TEST_F(TestCrypter, bundle_round_trip) {
    BundleCodec codec(TEST_KDF_ROUNDS);
    const std::string plaintext = "{\"wallet\":{\"name\":\"bundle\"}}";

    std::vector<unsigned char> blob;
    ASSERT_TRUE(codec.Encrypt(plaintext, passphrase, blob));
    EXPECT_EQ(blob.size(), BundleCodec::HEADER_SIZE + plaintext.size() + BundleCodec::TAG_SIZE);
    EXPECT_EQ(blob[0], BundleCodec::VERSION);
    EXPECT_EQ(std::vector<unsigned char>(blob.begin() + 1, blob.begin() + 5),
              std::vector<unsigned char>({0, 0, 0, static_cast<unsigned char>(TEST_KDF_ROUNDS)}));
    EXPECT_EQ(std::string(blob.begin(), blob.end()).find("bundle"), std::string::npos);

    std::string decrypted;
    ASSERT_TRUE(codec.Decrypt(blob, passphrase, decrypted));
    EXPECT_EQ(decrypted, plaintext);

    // salt and nonce are fresh per call
    std::vector<unsigned char> again;
    ASSERT_TRUE(codec.Encrypt(plaintext, passphrase, again));
    EXPECT_NE(again, blob);
}

TEST_F(TestCrypter, bundle_rejections) {
    BundleCodec codec(TEST_KDF_ROUNDS);
    std::vector<unsigned char> blob;
    ASSERT_TRUE(codec.Encrypt("secret bundle", passphrase, blob));
    std::string out;

    EXPECT_FALSE(codec.Decrypt(blob, wrong, out));

    // the rounds travel with the blob
    ASSERT_TRUE(BundleCodec(TEST_KDF_ROUNDS + 1).Decrypt(blob, passphrase, out));
    EXPECT_EQ(out, "secret bundle");

    // and are authenticated
    auto tampered = blob;
    tampered[4] ^= 0x01;
    EXPECT_FALSE(codec.Decrypt(tampered, passphrase, out));

    tampered = blob;
    std::fill(tampered.begin() + 1, tampered.begin() + 5, 0);
    EXPECT_FALSE(codec.Decrypt(tampered, passphrase, out));

    tampered = blob;
    std::fill(tampered.begin() + 1, tampered.begin() + 5, 0xff);
    EXPECT_FALSE(codec.Decrypt(tampered, passphrase, out));

    tampered = blob;
    tampered.back() ^= 0x01;
    EXPECT_FALSE(codec.Decrypt(tampered, passphrase, out));

    tampered = blob;
    tampered[BundleCodec::HEADER_SIZE] ^= 0x01;
    EXPECT_FALSE(codec.Decrypt(tampered, passphrase, out));

    tampered    = blob;
    tampered[0] = BundleCodec::VERSION + 1;
    EXPECT_FALSE(codec.Decrypt(tampered, passphrase, out));

    std::vector<unsigned char> truncated(blob.begin(), blob.begin() + BundleCodec::HEADER_SIZE + 4);
    EXPECT_FALSE(codec.Decrypt(truncated, passphrase, out));
    EXPECT_FALSE(codec.Decrypt(std::vector<unsigned char>(), passphrase, out));

    ASSERT_TRUE(codec.Decrypt(blob, passphrase, out));
    EXPECT_EQ(out, "secret bundle");
}

TEST_F(TestCrypter, secure_random) {
    SecureByte a, b;
    ASSERT_TRUE(GetSecureRand(a, 32));
    ASSERT_TRUE(GetSecureRand(b, 32));
    EXPECT_EQ(a.size(), 32);
    EXPECT_NE(a, b);
}
