// Copyright (c) 2019 EPI-ONE Core Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef HDVAULT_WALLET_H
#define HDVAULT_WALLET_H

#include "account.h"
#include "account_stream.h"
#include "bundle_codec.h"
#include "crypter.h"
#include "key_deriver.h"
#include "name_index.h"
#include "records.h"
#include "secure.h"
#include "uuid.h"
#include "wallet_error.h"
#include "wallet_store.h"

#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

/**
 * Hierarchical deterministic wallet.
 *
 * All accounts derive from one 32 byte seed, which is stored encrypted
 * and held in memory only while the wallet is unlocked. Account n of
 * the wallet lives at m/12381/3600/<walletIndex>/<n>/0; the counter is
 * persisted before any key is derived, so a number is never handed out
 * twice even when a creation fails halfway.
 *
 * Lock, Unlock and CreateAccount take the wallet lock exclusively,
 * lookups and exports share it.
 */
class HDWallet : public std::enable_shared_from_this<HDWallet> {
public:
    inline static const std::string TYPE = "hierarchical deterministic";
    static constexpr uint32_t VERSION    = 1;

    // names with these prefixes are never stored
    static constexpr char RESERVED_PREFIX = '_';
    inline static const std::string PATH_PREFIX = "m/";

    static std::shared_ptr<HDWallet> CreateWallet(const std::string& name,
                                                  const SecureString& passphrase,
                                                  WalletStore& store,
                                                  const Encryptor& encryptor,
                                                  const KeyDeriver& deriver = DefaultKeyDeriver());

    static std::shared_ptr<HDWallet> CreateWalletFromSeed(const std::string& name,
                                                          uint32_t walletIndex,
                                                          const SecureString& passphrase,
                                                          WalletStore& store,
                                                          const Encryptor& encryptor,
                                                          const SecureByte& seed,
                                                          const KeyDeriver& deriver = DefaultKeyDeriver());

    static std::shared_ptr<HDWallet> OpenWallet(const std::string& name,
                                                WalletStore& store,
                                                const Encryptor& encryptor,
                                                const KeyDeriver& deriver = DefaultKeyDeriver());

    static std::shared_ptr<HDWallet> DeserializeWallet(const std::string& data,
                                                       WalletStore& store,
                                                       const Encryptor& encryptor,
                                                       const KeyDeriver& deriver = DefaultKeyDeriver());

    static std::shared_ptr<HDWallet> Import(const std::vector<unsigned char>& blob,
                                            const SecureString& passphrase,
                                            WalletStore& store,
                                            const Encryptor& encryptor,
                                            const KeyDeriver& deriver = DefaultKeyDeriver(),
                                            const BundleCodec& codec  = BundleCodec());

    HDWallet(const HDWallet&) = delete;
    HDWallet& operator=(const HDWallet&) = delete;
    ~HDWallet();

    const UUID& ID() const {
        return id_;
    }

    const std::string& Name() const {
        return name_;
    }

    const std::string& Type() const {
        return TYPE;
    }

    uint32_t Version() const {
        return version_;
    }

    uint32_t WalletIndex() const {
        return walletIndex_;
    }

    uint32_t NextAccount() const;

    WalletStore& GetStore() const {
        return store_;
    }

    const Encryptor& GetEncryptor() const {
        return encryptor_;
    }

    const KeyDeriver& GetKeyDeriver() const {
        return deriver_;
    }

    void Lock();

    /** Throws WalletError(kAuthenticationFailure) and stays locked on a wrong passphrase */
    void Unlock(const SecureString& passphrase);
    bool IsUnlocked() const;

    /** Copy of the seed, throws WalletError(kLockedWallet) while locked */
    SecureByte Key() const;

    AccountPtr CreateAccount(const std::string& name, const SecureString& passphrase);

    /**
     * Names starting with "m/" are taken as derivation paths and the
     * account is computed from the seed without touching the store.
     */
    AccountPtr AccountByName(const std::string& name) const;
    AccountPtr AccountByID(const UUID& id) const;

    /** A new stream over the stored accounts on every call */
    std::unique_ptr<AccountStream> Accounts(size_t capacity = DEFAULT_STREAM_CAPACITY) const;

    /** Wallet and accounts, encrypted under the export passphrase */
    std::vector<unsigned char> Export(const SecureString& passphrase, const BundleCodec& codec = BundleCodec()) const;

    NameIndex GetIndex() const;

    std::string Serialize() const;

    static bool IsReservedName(const std::string& name);

private:
    HDWallet(WalletStore& store, const Encryptor& encryptor, const KeyDeriver& deriver);

    // callers hold lock_
    records::WalletRecord ToRecord() const;

    // throws WalletError(kCorruptState)
    void FromRecord(const records::WalletRecord& record);

    void StoreWallet() const;
    void StoreAccountsIndex() const;
    void RetrieveAccountsIndex();

    AccountPtr LoadAccount(const UUID& id) const;
    AccountPtr ProgrammaticAccount(const std::string& path) const;

    static void CheckNewWallet(const std::string& name, const WalletStore& store);

    UUID id_;
    std::string name_;
    uint32_t version_;
    CryptoPayload crypto_;
    uint32_t walletIndex_;
    uint32_t nextAccount_;
    NameIndex index_;

    SecureByte seed_;

    WalletStore& store_;
    const Encryptor& encryptor_;
    const KeyDeriver& deriver_;

    mutable std::shared_mutex lock_;
};

using WalletPtr = std::shared_ptr<HDWallet>;

#endif // HDVAULT_WALLET_H
