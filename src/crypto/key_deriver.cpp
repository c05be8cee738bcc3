// Copyright (c) 2019 EPI-ONE Core Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "key_deriver.h"
#include "keypath.h"
#include "random.h"
#include "spdlog/spdlog.h"

#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <secp256k1.h>
#include <stdexcept>

namespace {
const unsigned char kHashKey[] = {'B', 'i', 't', 'c', 'o', 'i', 'n', ' ', 's', 'e', 'e', 'd'};

bool HMACSHA512(const unsigned char* key,
                size_t keyLen,
                const unsigned char* data,
                size_t dataLen,
                SecureByte& out) {
    out.resize(64);
    unsigned int outLen = 0;
    if (HMAC(EVP_sha512(), key, static_cast<int>(keyLen), data, dataLen, out.data(), &outLen) == nullptr ||
        outLen != out.size()) {
        memory_cleanse(out.data(), out.size());
        return false;
    }
    return true;
}
} // namespace

Secp256k1Deriver::Secp256k1Deriver() : ctx_(secp256k1_context_create(SECP256K1_CONTEXT_SIGN)) {
    if (ctx_ == nullptr) {
        throw std::runtime_error("failed to create secp256k1 context");
    }

    // Pass in a random blinding seed to the secp256k1 context.
    SecureByte vseed;
    if (!GetSecureRand(vseed, 32) || !secp256k1_context_randomize(ctx_, vseed.data())) {
        secp256k1_context_destroy(ctx_);
        throw std::runtime_error("failed to randomize secp256k1 context");
    }
}

Secp256k1Deriver::~Secp256k1Deriver() {
    secp256k1_context_destroy(ctx_);
}

bool Secp256k1Deriver::SetSeed(const SecureByte& seed, ExtKey& master) const {
    SecureByte vout;
    if (!HMACSHA512(kHashKey, sizeof(kHashKey), seed.data(), seed.size(), vout)) {
        return false;
    }
    master.key.assign(vout.begin(), vout.begin() + 32);
    master.chaincode.assign(vout.begin() + 32, vout.end());
    return secp256k1_ec_seckey_verify(ctx_, master.key.data()) == 1;
}

bool Secp256k1Deriver::Derive(const ExtKey& parent, ExtKey& child, uint32_t nChild) const {
    SecureByte data;
    data.reserve(37);
    if (nChild & HARDENED_BIT) {
        data.push_back(0);
        data.insert(data.end(), parent.key.begin(), parent.key.end());
    } else {
        std::vector<unsigned char> pubkey;
        if (!PublicKey(parent.key, pubkey)) {
            return false;
        }
        data.insert(data.end(), pubkey.begin(), pubkey.end());
    }
    data.push_back((nChild >> 24) & 0xFF);
    data.push_back((nChild >> 16) & 0xFF);
    data.push_back((nChild >> 8) & 0xFF);
    data.push_back((nChild >> 0) & 0xFF);

    SecureByte vout;
    if (!HMACSHA512(parent.chaincode.data(), parent.chaincode.size(), data.data(), data.size(), vout)) {
        return false;
    }

    child.key = parent.key;
    child.chaincode.assign(vout.begin() + 32, vout.end());
    return secp256k1_ec_privkey_tweak_add(ctx_, child.key.data(), vout.data()) == 1;
}

bool Secp256k1Deriver::DeriveKeyPair(const SecureByte& seed, const std::string& path, KeyPair& out) const {
    auto keypath = ParseKeypath(path);
    if (!keypath) {
        spdlog::debug("[KeyDeriver] Invalid path {}", path);
        return false;
    }
    if (seed.empty()) {
        return false;
    }

    ExtKey key;
    if (!SetSeed(seed, key)) {
        return false;
    }
    for (const auto& nChild : *keypath) {
        ExtKey newkey;
        if (!Derive(key, newkey, nChild)) {
            spdlog::debug("[KeyDeriver] Unusable child {} on path {}", nChild, path);
            return false;
        }
        key = std::move(newkey);
    }

    if (!PublicKey(key.key, out.pubkey)) {
        return false;
    }
    out.secret = std::move(key.key);
    return true;
}

bool Secp256k1Deriver::PublicKey(const SecureByte& secret, std::vector<unsigned char>& pubkey) const {
    if (secret.size() != SECRET_KEY_SIZE) {
        return false;
    }

    secp256k1_pubkey point;
    if (!secp256k1_ec_pubkey_create(ctx_, &point, secret.data())) {
        return false;
    }

    size_t clen = 33;
    pubkey.resize(clen);
    secp256k1_ec_pubkey_serialize(ctx_, pubkey.data(), &clen, &point, SECP256K1_EC_COMPRESSED);
    pubkey.resize(clen);
    return true;
}

const KeyDeriver& DefaultKeyDeriver() {
    static const Secp256k1Deriver deriver;
    return deriver;
}
