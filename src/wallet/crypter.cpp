// Copyright (c) 2009-2019 The Bitcoin Core developers
// Copyright (c) 2019 EPI-ONE Core Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "crypter.h"
#include "random.h"
#include "spdlog/spdlog.h"
#include "strencodings.h"

#include <cmath>
#include <cstdint>
#include <memory>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <optional>

using google::protobuf::Struct;

namespace {
using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

void SetString(Struct& s, const std::string& key, const std::string& value) {
    (*s.mutable_fields())[key].set_string_value(value);
}

void SetNumber(Struct& s, const std::string& key, double value) {
    (*s.mutable_fields())[key].set_number_value(value);
}

Struct* AddStruct(Struct& s, const std::string& key) {
    return (*s.mutable_fields())[key].mutable_struct_value();
}

const Struct* GetStruct(const Struct& s, const std::string& key) {
    auto it = s.fields().find(key);
    if (it == s.fields().end() || !it->second.has_struct_value()) {
        return nullptr;
    }
    return &it->second.struct_value();
}

std::optional<std::string> GetString(const Struct& s, const std::string& key) {
    auto it = s.fields().find(key);
    if (it == s.fields().end() || it->second.kind_case() != google::protobuf::Value::kStringValue) {
        return {};
    }
    return it->second.string_value();
}

std::optional<uint32_t> GetUInt(const Struct& s, const std::string& key) {
    auto it = s.fields().find(key);
    if (it == s.fields().end() || it->second.kind_case() != google::protobuf::Value::kNumberValue) {
        return {};
    }
    double value = it->second.number_value();
    if (value < 0 || value > UINT32_MAX || std::floor(value) != value) {
        return {};
    }
    return static_cast<uint32_t>(value);
}

std::optional<std::vector<unsigned char>> GetHex(const Struct& s, const std::string& key) {
    auto str = GetString(s, key);
    if (!str) {
        return {};
    }
    return ParseHex(*str);
}
} // namespace

bool Crypter::SetKeyFromPassphrase(const SecureString& strKeyData,
                                   const std::vector<unsigned char>& salt,
                                   const unsigned int nRounds) {
    if (nRounds < 1 || nRounds > MAX_KDF_ROUNDS || salt.size() != WALLET_CRYPTO_SALT_SIZE) {
        return false;
    }

    SecureByte out(WALLET_CRYPTO_DERIVED_SIZE);
    int i = PKCS5_PBKDF2_HMAC(strKeyData.data(), strKeyData.size(), salt.data(), salt.size(), nRounds, EVP_sha256(),
                              out.size(), out.data());

    if (i == 0) {
        CleanKey();
        return false;
    }

    memcpy(passphraseKey_.data(), out.data(), WALLET_CRYPTO_KEY_SIZE);
    memcpy(checksumKey_.data(), out.data() + WALLET_CRYPTO_KEY_SIZE, checksumKey_.size());

    fKeySet_ = true;
    return true;
}

bool Crypter::Encrypt(const SecureByte& plaintext,
                      const std::vector<unsigned char>& chIV,
                      std::vector<unsigned char>& ciphertext) const {
    if (!IsReady() || chIV.size() != WALLET_CRYPTO_IV_SIZE) {
        return false;
    }

    CipherCtxPtr ctx(EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free);
    if (!ctx || EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_cbc(), nullptr, passphraseKey_.data(), chIV.data()) != 1) {
        return false;
    }

    // max ciphertext len for a n bytes of plaintext is
    // n + AES_BLOCKSIZE bytes
    ciphertext.resize(plaintext.size() + EVP_MAX_BLOCK_LENGTH);
    int nLen   = 0;
    int nFinal = 0;
    if (EVP_EncryptUpdate(ctx.get(), ciphertext.data(), &nLen, plaintext.data(), plaintext.size()) != 1 ||
        EVP_EncryptFinal_ex(ctx.get(), ciphertext.data() + nLen, &nFinal) != 1) {
        return false;
    }

    ciphertext.resize(nLen + nFinal);
    return true;
}

bool Crypter::Decrypt(const std::vector<unsigned char>& ciphertext,
                      const std::vector<unsigned char>& chIV,
                      SecureByte& plaintext) const {
    if (!IsReady() || chIV.size() != WALLET_CRYPTO_IV_SIZE || ciphertext.empty()) {
        return false;
    }

    CipherCtxPtr ctx(EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free);
    if (!ctx || EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_cbc(), nullptr, passphraseKey_.data(), chIV.data()) != 1) {
        return false;
    }

    // plaintext will always be equal to or lesser than length of ciphertext
    plaintext.resize(ciphertext.size() + EVP_MAX_BLOCK_LENGTH);
    int nLen   = 0;
    int nFinal = 0;
    if (EVP_DecryptUpdate(ctx.get(), plaintext.data(), &nLen, ciphertext.data(), ciphertext.size()) != 1 ||
        EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + nLen, &nFinal) != 1) {
        memory_cleanse(plaintext.data(), plaintext.size());
        plaintext.clear();
        return false;
    }

    plaintext.resize(nLen + nFinal);
    return true;
}

bool Crypter::Checksum(const std::vector<unsigned char>& ciphertext, std::vector<unsigned char>& checksum) const {
    if (!IsReady()) {
        return false;
    }

    SecureByte preimage(checksumKey_.begin(), checksumKey_.end());
    preimage.insert(preimage.end(), ciphertext.begin(), ciphertext.end());

    checksum.resize(EVP_MAX_MD_SIZE);
    unsigned int nLen = 0;
    if (EVP_Digest(preimage.data(), preimage.size(), checksum.data(), &nLen, EVP_sha256(), nullptr) != 1) {
        return false;
    }
    checksum.resize(nLen);
    return true;
}

KeystoreEncryptor::KeystoreEncryptor(uint32_t rounds) : rounds_(rounds) {}

bool KeystoreEncryptor::Encrypt(const SecureByte& secret, const SecureString& passphrase, CryptoPayload& payload) const {
    std::vector<unsigned char> salt(WALLET_CRYPTO_SALT_SIZE);
    std::vector<unsigned char> iv(WALLET_CRYPTO_IV_SIZE);
    if (!GetOpenSSLRand(salt.data(), salt.size()) || !GetOpenSSLRand(iv.data(), iv.size())) {
        spdlog::error("[Crypter] Random generator failure");
        return false;
    }

    Crypter crypter;
    if (!crypter.SetKeyFromPassphrase(passphrase, salt, rounds_)) {
        return false;
    }

    std::vector<unsigned char> ciphertext;
    std::vector<unsigned char> checksum;
    if (!crypter.Encrypt(secret, iv, ciphertext) || !crypter.Checksum(ciphertext, checksum)) {
        return false;
    }

    payload.Clear();

    auto* kdf    = AddStruct(payload, "kdf");
    auto* params = AddStruct(*kdf, "params");
    SetString(*kdf, "function", "pbkdf2");
    SetNumber(*params, "dklen", WALLET_CRYPTO_DERIVED_SIZE);
    SetNumber(*params, "c", rounds_);
    SetString(*params, "prf", "hmac-sha256");
    SetString(*params, "salt", HexStr(salt));
    SetString(*kdf, "message", "");

    auto* check = AddStruct(payload, "checksum");
    SetString(*check, "function", "sha256");
    AddStruct(*check, "params");
    SetString(*check, "message", HexStr(checksum));

    auto* cipher = AddStruct(payload, "cipher");
    SetString(*cipher, "function", "aes-256-cbc");
    SetString(*AddStruct(*cipher, "params"), "iv", HexStr(iv));
    SetString(*cipher, "message", HexStr(ciphertext));

    return true;
}

bool KeystoreEncryptor::Decrypt(const CryptoPayload& payload, const SecureString& passphrase, SecureByte& secret) const {
    const auto* kdf    = GetStruct(payload, "kdf");
    const auto* check  = GetStruct(payload, "checksum");
    const auto* cipher = GetStruct(payload, "cipher");
    if (!kdf || !check || !cipher) {
        return false;
    }

    const auto* kdfParams    = GetStruct(*kdf, "params");
    const auto* cipherParams = GetStruct(*cipher, "params");
    if (!kdfParams || !cipherParams || GetString(*kdf, "function") != std::string("pbkdf2") ||
        GetString(*kdfParams, "prf") != std::string("hmac-sha256") ||
        GetUInt(*kdfParams, "dklen") != WALLET_CRYPTO_DERIVED_SIZE ||
        GetString(*check, "function") != std::string("sha256") ||
        GetString(*cipher, "function") != std::string("aes-256-cbc")) {
        return false;
    }

    auto rounds     = GetUInt(*kdfParams, "c");
    auto salt       = GetHex(*kdfParams, "salt");
    auto checksum   = GetHex(*check, "message");
    auto iv         = GetHex(*cipherParams, "iv");
    auto ciphertext = GetHex(*cipher, "message");
    if (!rounds || !salt || !checksum || !iv || !ciphertext) {
        return false;
    }

    Crypter crypter;
    if (!crypter.SetKeyFromPassphrase(passphrase, *salt, *rounds)) {
        return false;
    }

    std::vector<unsigned char> expected;
    if (!crypter.Checksum(*ciphertext, expected) || expected.size() != checksum->size() ||
        CRYPTO_memcmp(expected.data(), checksum->data(), expected.size()) != 0) {
        return false;
    }

    return crypter.Decrypt(*ciphertext, *iv, secret);
}
