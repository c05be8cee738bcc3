// Copyright (c) 2019 EPI-ONE Core Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef HDVAULT_BUNDLE_CODEC_H
#define HDVAULT_BUNDLE_CODEC_H

#include "secure.h"

#include <cstdint>
#include <string>
#include <vector>

static const uint32_t DEFAULT_BUNDLE_ROUNDS = 100000;

/**
 * Passphrase encryption of an exported wallet.
 *
 * Layout: version(1) | rounds(4, big endian) | salt(16) | nonce(12) | ciphertext | tag(16)
 * The AES-256-GCM key is PBKDF2-HMAC-SHA256 of the passphrase. The
 * header is authenticated as additional data. Decryption uses the
 * rounds from the header, so any codec reads any bundle.
 */
class BundleCodec {
public:
    static constexpr unsigned char VERSION = 1;
    static constexpr size_t SALT_SIZE = 16;
    static constexpr size_t NONCE_SIZE = 12;
    static constexpr size_t TAG_SIZE = 16;
    static constexpr size_t ROUNDS_SIZE = 4;
    static constexpr size_t HEADER_SIZE = 1 + ROUNDS_SIZE + SALT_SIZE + NONCE_SIZE;

    explicit BundleCodec(uint32_t rounds = DEFAULT_BUNDLE_ROUNDS);

    bool Encrypt(const std::string& plaintext, const SecureString& passphrase, std::vector<unsigned char>& blob) const;

    /** False on a wrong passphrase, a truncated blob, an unknown version or out of range rounds */
    bool Decrypt(const std::vector<unsigned char>& blob, const SecureString& passphrase, std::string& plaintext) const;

private:
    static bool DeriveKey(const SecureString& passphrase, const unsigned char* salt, uint32_t rounds, SecureByte& key);

    uint32_t rounds_;
};

#endif // HDVAULT_BUNDLE_CODEC_H
