// Copyright (c) 2009-2018 The Bitcoin Core developers
// Copyright (c) 2019 EPI-ONE Core Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef HDVAULT_WALLET_CRYPTER_H
#define HDVAULT_WALLET_CRYPTER_H

#include "records.h"
#include "secure.h"

#include <cstdint>
#include <string>
#include <vector>

const unsigned int WALLET_CRYPTO_KEY_SIZE     = 32;
const unsigned int WALLET_CRYPTO_DERIVED_SIZE = 64;
const unsigned int WALLET_CRYPTO_SALT_SIZE    = 32;
const unsigned int WALLET_CRYPTO_IV_SIZE      = 16;

// PBKDF2 iterations of a freshly produced payload
static const uint32_t DEFAULT_KDF_ROUNDS = 262144;

// upper bound accepted from a stored payload
static const uint32_t MAX_KDF_ROUNDS = 1U << 24;

/**
 * Passphrase based encryption of seeds and account secrets.
 * Implementations report every failure, including a wrong passphrase,
 * by returning false.
 */
class Encryptor {
public:
    virtual ~Encryptor() = default;

    virtual std::string Name() const = 0;
    virtual uint32_t Version() const = 0;

    virtual bool Encrypt(const SecureByte& secret, const SecureString& passphrase, CryptoPayload& payload) const = 0;
    virtual bool Decrypt(const CryptoPayload& payload, const SecureString& passphrase, SecureByte& secret) const = 0;
};

/**
 * Encryption/decryption context with key information.
 *
 * The passphrase is stretched with PBKDF2-HMAC-SHA256 into 64 bytes:
 * the first half is the AES-256-CBC key, the second half keys the
 * SHA-256 checksum over the ciphertext.
 */
class Crypter {
private:
    SecureByte passphraseKey_;
    SecureByte checksumKey_;
    bool fKeySet_;

public:
    bool SetKeyFromPassphrase(const SecureString& strKeyData,
                              const std::vector<unsigned char>& chSalt,
                              const unsigned int nRounds);
    bool Encrypt(const SecureByte& plaintext,
                 const std::vector<unsigned char>& chIV,
                 std::vector<unsigned char>& ciphertext) const;
    bool Decrypt(const std::vector<unsigned char>& ciphertext,
                 const std::vector<unsigned char>& chIV,
                 SecureByte& plaintext) const;
    bool Checksum(const std::vector<unsigned char>& ciphertext, std::vector<unsigned char>& checksum) const;

    void CleanKey() {
        memory_cleanse(passphraseKey_.data(), passphraseKey_.size());
        memory_cleanse(checksumKey_.data(), checksumKey_.size());
        fKeySet_ = false;
    }

    bool IsReady() const {
        return fKeySet_;
    }

    Crypter() : fKeySet_(false) {
        passphraseKey_.resize(WALLET_CRYPTO_KEY_SIZE);
        checksumKey_.resize(WALLET_CRYPTO_DERIVED_SIZE - WALLET_CRYPTO_KEY_SIZE);
    }

    ~Crypter() {
        CleanKey();
    }
};

/**
 * Keystore style payload:
 *
 *   { "kdf":      { "function": "pbkdf2",
 *                   "params": { "dklen": 64, "c": N, "prf": "hmac-sha256", "salt": hex },
 *                   "message": "" },
 *     "checksum": { "function": "sha256", "params": {}, "message": hex },
 *     "cipher":   { "function": "aes-256-cbc", "params": { "iv": hex }, "message": hex } }
 *
 * Decryption honours the round count stored in the payload, so payloads
 * written with a different setting stay readable.
 */
class KeystoreEncryptor : public Encryptor {
public:
    inline static const std::string NAME = "keystore";
    static constexpr uint32_t VERSION    = 4;

    explicit KeystoreEncryptor(uint32_t rounds = DEFAULT_KDF_ROUNDS);

    std::string Name() const override {
        return NAME;
    }

    uint32_t Version() const override {
        return VERSION;
    }

    uint32_t GetRounds() const {
        return rounds_;
    }

    bool Encrypt(const SecureByte& secret, const SecureString& passphrase, CryptoPayload& payload) const override;
    bool Decrypt(const CryptoPayload& payload, const SecureString& passphrase, SecureByte& secret) const override;

private:
    uint32_t rounds_;
};

#endif // HDVAULT_WALLET_CRYPTER_H
