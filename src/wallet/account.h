// Copyright (c) 2019 EPI-ONE Core Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef HDVAULT_ACCOUNT_H
#define HDVAULT_ACCOUNT_H

#include "records.h"
#include "secure.h"
#include "uuid.h"

#include <memory>
#include <mutex>
#include <string>
#include <vector>

class HDWallet;

/**
 * One derived key of a wallet. The private key is kept encrypted in
 * crypto_ and only decrypted into memory by Unlock.
 *
 * The wallet is a non-owning back reference used to reach the wallet's
 * encryptor and key deriver. Unlock throws WalletError(kNotFound) once
 * that wallet is gone.
 */
class Account {
public:
    Account(std::weak_ptr<const HDWallet> wallet,
            const UUID& id,
            std::string name,
            std::string path,
            std::vector<unsigned char> pubkey,
            CryptoPayload crypto,
            std::string encryptor,
            uint32_t version);

    Account(const Account&) = delete;
    Account& operator=(const Account&) = delete;

    ~Account();

    const UUID& ID() const {
        return id_;
    }

    const std::string& Name() const {
        return name_;
    }

    const std::string& Path() const {
        return path_;
    }

    const std::vector<unsigned char>& PublicKey() const {
        return pubkey_;
    }

    const CryptoPayload& Crypto() const {
        return crypto_;
    }

    const std::string& EncryptorName() const {
        return encryptor_;
    }

    uint32_t EncryptorVersion() const {
        return version_;
    }

    /** Null once the wallet has been released */
    std::shared_ptr<const HDWallet> GetWallet() const {
        return wallet_.lock();
    }

    /**
     * Decrypts the private key and checks it against the public key.
     * Throws WalletError(kAuthenticationFailure) and stays locked otherwise.
     */
    void Unlock(const SecureString& passphrase);
    void Lock();
    bool IsUnlocked() const;

    /** Copy of the private key, throws WalletError(kLockedWallet) while locked */
    SecureByte PrivateKey() const;

    records::AccountRecord ToRecord() const;
    std::string Serialize() const;

    /** Throws WalletError(kCorruptState) naming the first bad field */
    static std::shared_ptr<Account> FromRecord(const records::AccountRecord& record,
                                               std::weak_ptr<const HDWallet> wallet);
    static std::shared_ptr<Account> Deserialize(const std::string& data, std::weak_ptr<const HDWallet> wallet);

private:
    friend class HDWallet;

    // used for accounts computed from the seed, which start unlocked
    void SetSecret(SecureByte secret);

    std::weak_ptr<const HDWallet> wallet_;
    UUID id_;
    std::string name_;
    std::string path_;
    std::vector<unsigned char> pubkey_;
    CryptoPayload crypto_;
    std::string encryptor_;
    uint32_t version_;

    mutable std::mutex mutex_;
    SecureByte secret_;
};

using AccountPtr = std::shared_ptr<Account>;

#endif // HDVAULT_ACCOUNT_H
