// Copyright (c) 2019 EPI-ONE Core Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "bundle_codec.h"
#include "crypter.h"
#include "random.h"
#include "spdlog/spdlog.h"

#include <memory>
#include <openssl/evp.h>

namespace {
using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

void WriteBE32(unsigned char* ptr, uint32_t x) {
    ptr[0] = x >> 24;
    ptr[1] = x >> 16;
    ptr[2] = x >> 8;
    ptr[3] = x;
}

uint32_t ReadBE32(const unsigned char* ptr) {
    return (uint32_t(ptr[0]) << 24) | (uint32_t(ptr[1]) << 16) | (uint32_t(ptr[2]) << 8) | uint32_t(ptr[3]);
}
} // namespace

BundleCodec::BundleCodec(uint32_t rounds) : rounds_(rounds > 0 ? rounds : 1) {}

bool BundleCodec::DeriveKey(const SecureString& passphrase,
                            const unsigned char* salt,
                            uint32_t rounds,
                            SecureByte& key) {
    key.resize(32);
    return PKCS5_PBKDF2_HMAC(passphrase.data(), passphrase.size(), salt, SALT_SIZE, rounds, EVP_sha256(), key.size(),
                             key.data()) == 1;
}

bool BundleCodec::Encrypt(const std::string& plaintext,
                          const SecureString& passphrase,
                          std::vector<unsigned char>& blob) const {
    blob.assign(HEADER_SIZE, 0);
    blob[0] = VERSION;
    WriteBE32(blob.data() + 1, rounds_);
    unsigned char* salt  = blob.data() + 1 + ROUNDS_SIZE;
    unsigned char* nonce = salt + SALT_SIZE;
    if (!GetOpenSSLRand(salt, SALT_SIZE) || !GetOpenSSLRand(nonce, NONCE_SIZE)) {
        spdlog::error("[Export] Random generator failure");
        return false;
    }

    SecureByte key;
    if (!DeriveKey(passphrase, salt, rounds_, key)) {
        return false;
    }

    CipherCtxPtr ctx(EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free);
    if (!ctx || EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, NONCE_SIZE, nullptr) != 1 ||
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce) != 1) {
        return false;
    }

    int nLen = 0;
    if (EVP_EncryptUpdate(ctx.get(), nullptr, &nLen, blob.data(), HEADER_SIZE) != 1) {
        return false;
    }

    blob.resize(HEADER_SIZE + plaintext.size() + TAG_SIZE);
    int nFinal = 0;
    if (EVP_EncryptUpdate(ctx.get(), blob.data() + HEADER_SIZE, &nLen,
                          reinterpret_cast<const unsigned char*>(plaintext.data()), plaintext.size()) != 1 ||
        EVP_EncryptFinal_ex(ctx.get(), blob.data() + HEADER_SIZE + nLen, &nFinal) != 1) {
        return false;
    }

    size_t ctLen = nLen + nFinal;
    blob.resize(HEADER_SIZE + ctLen + TAG_SIZE);
    return EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, TAG_SIZE, blob.data() + HEADER_SIZE + ctLen) == 1;
}

bool BundleCodec::Decrypt(const std::vector<unsigned char>& blob,
                          const SecureString& passphrase,
                          std::string& plaintext) const {
    if (blob.size() < HEADER_SIZE + TAG_SIZE || blob[0] != VERSION) {
        return false;
    }

    uint32_t rounds = ReadBE32(blob.data() + 1);
    if (rounds < 1 || rounds > MAX_KDF_ROUNDS) {
        spdlog::debug("[Export] Bundle asks for {} key derivation rounds", rounds);
        return false;
    }

    const unsigned char* salt  = blob.data() + 1 + ROUNDS_SIZE;
    const unsigned char* nonce = salt + SALT_SIZE;
    const unsigned char* ct    = blob.data() + HEADER_SIZE;
    size_t ctLen               = blob.size() - HEADER_SIZE - TAG_SIZE;
    std::vector<unsigned char> tag(blob.end() - TAG_SIZE, blob.end());

    SecureByte key;
    if (!DeriveKey(passphrase, salt, rounds, key)) {
        return false;
    }

    CipherCtxPtr ctx(EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free);
    if (!ctx || EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, NONCE_SIZE, nullptr) != 1 ||
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce) != 1) {
        return false;
    }

    int nLen = 0;
    if (EVP_DecryptUpdate(ctx.get(), nullptr, &nLen, blob.data(), HEADER_SIZE) != 1) {
        return false;
    }

    std::string out(ctLen, '\0');
    int nFinal = 0;
    if (EVP_DecryptUpdate(ctx.get(), reinterpret_cast<unsigned char*>(&out[0]), &nLen, ct, ctLen) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, TAG_SIZE, tag.data()) != 1 ||
        EVP_DecryptFinal_ex(ctx.get(), reinterpret_cast<unsigned char*>(&out[0]) + nLen, &nFinal) != 1) {
        return false;
    }

    out.resize(nLen + nFinal);
    plaintext = std::move(out);
    return true;
}
