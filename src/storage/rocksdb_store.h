// Copyright (c) 2019 EPI-ONE Core Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef HDVAULT_ROCKSDB_STORE_H
#define HDVAULT_ROCKSDB_STORE_H

#include "rocksdb.h"
#include "wallet_store.h"

/**
 * Durable wallet store on RocksDB. Every record lives in a column
 * family of its own kind; account keys are prefixed with the wallet
 * id so a wallet's accounts form one contiguous range.
 */
class RocksDBStore : public WalletStore, public RocksDB {
public:
    explicit RocksDBStore(std::string dbPath);

    std::string Name() const override {
        return "rocksdb";
    }

    bool StoreWallet(const UUID& walletID, const std::string& walletName, const std::string& data) override;
    std::optional<std::string> RetrieveWallet(const std::string& walletName) const override;
    std::optional<std::string> RetrieveWalletByID(const UUID& walletID) const override;

    bool StoreAccount(const UUID& walletID, const UUID& accountID, const std::string& data) override;
    std::optional<std::string> RetrieveAccount(const UUID& walletID, const UUID& accountID) const override;
    bool RetrieveAccounts(const UUID& walletID, const AccountVisitor& visitor) const override;

    bool StoreAccountsIndex(const UUID& walletID, const std::string& data) override;
    std::optional<std::string> RetrieveAccountsIndex(const UUID& walletID) const override;

    bool DeleteAccountsIndex(const UUID& walletID);
};

#endif // HDVAULT_ROCKSDB_STORE_H
