// Copyright (c) 2019 EPI-ONE Core Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef HDVAULT_KEY_DERIVER_H
#define HDVAULT_KEY_DERIVER_H

#include "secure.h"

#include <array>
#include <string>
#include <vector>

struct secp256k1_context_struct;
typedef struct secp256k1_context_struct secp256k1_context;

static const size_t SEED_SIZE       = 32;
static const size_t SECRET_KEY_SIZE = 32;

struct KeyPair {
    SecureByte secret;
    std::vector<unsigned char> pubkey;
};

/**
 * Deterministic derivation of key pairs from a wallet seed along a
 * textual path. Implementations must be safe to call concurrently.
 */
class KeyDeriver {
public:
    virtual ~KeyDeriver() = default;

    virtual bool DeriveKeyPair(const SecureByte& seed, const std::string& path, KeyPair& out) const = 0;
    virtual bool PublicKey(const SecureByte& secret, std::vector<unsigned char>& pubkey) const = 0;
};

/**
 * BIP32 style derivation on secp256k1: the master key and chaincode come
 * from HMAC-SHA512 over the seed, children from HMAC-SHA512 keyed with
 * the parent chaincode. Public keys are 33 bytes compressed.
 */
class Secp256k1Deriver : public KeyDeriver {
public:
    Secp256k1Deriver();
    Secp256k1Deriver(const Secp256k1Deriver&) = delete;
    Secp256k1Deriver& operator=(const Secp256k1Deriver&) = delete;
    ~Secp256k1Deriver() override;

    bool DeriveKeyPair(const SecureByte& seed, const std::string& path, KeyPair& out) const override;
    bool PublicKey(const SecureByte& secret, std::vector<unsigned char>& pubkey) const override;

private:
    struct ExtKey {
        SecureByte key;
        SecureByte chaincode;
    };

    bool SetSeed(const SecureByte& seed, ExtKey& master) const;
    bool Derive(const ExtKey& parent, ExtKey& child, uint32_t nChild) const;

    secp256k1_context* ctx_;
};

/** Process wide deriver used when none is injected */
const KeyDeriver& DefaultKeyDeriver();

#endif // HDVAULT_KEY_DERIVER_H
