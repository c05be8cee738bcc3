// Copyright (c) 2019 EPI-ONE Core Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "rocksdb_store.h"
#include "spdlog/spdlog.h"

#include <memory>

using namespace rocksdb;

const std::string kWallets   = kDefaultColumnFamilyName;
const std::string kWalletIDs = "wallet_ids";
const std::string kAccounts  = "accounts";
const std::string kIndexes   = "accounts_index";

static const std::vector<std::string> COLUMN_NAMES = {
    kWallets, // (key) wallet name
              // (value) wallet record

    kWalletIDs, // (key) wallet id (16B)
                // (value) wallet name

    kAccounts, // (key) wallet id (16B) + account id (16B)
               // (value) account record

    kIndexes // (key) wallet id (16B)
             // (value) serialized name index
};

static std::string AccountKey(const UUID& walletID, const UUID& accountID) {
    return walletID.ToBytes() + accountID.ToBytes();
}

RocksDBStore::RocksDBStore(std::string dbPath) : RocksDB(std::move(dbPath), COLUMN_NAMES) {}

bool RocksDBStore::StoreWallet(const UUID& walletID, const std::string& walletName, const std::string& data) {
    WriteBatch batch;
    batch.Put(handleMap_.at(kWallets), walletName, data);
    batch.Put(handleMap_.at(kWalletIDs), walletID.ToBytes(), walletName);
    return Write(batch);
}

std::optional<std::string> RocksDBStore::RetrieveWallet(const std::string& walletName) const {
    return Get(kWallets, walletName);
}

std::optional<std::string> RocksDBStore::RetrieveWalletByID(const UUID& walletID) const {
    auto name = Get(kWalletIDs, walletID.ToBytes());
    if (!name) {
        return {};
    }
    return Get(kWallets, *name);
}

bool RocksDBStore::StoreAccount(const UUID& walletID, const UUID& accountID, const std::string& data) {
    return Put(kAccounts, AccountKey(walletID, accountID), data);
}

std::optional<std::string> RocksDBStore::RetrieveAccount(const UUID& walletID, const UUID& accountID) const {
    return Get(kAccounts, AccountKey(walletID, accountID));
}

bool RocksDBStore::RetrieveAccounts(const UUID& walletID, const AccountVisitor& visitor) const {
    const std::string prefix = walletID.ToBytes();

    std::unique_ptr<Iterator> iter(db_->NewIterator(ReadOptions(), handleMap_.at(kAccounts)));
    for (iter->Seek(prefix); iter->Valid() && iter->key().starts_with(prefix); iter->Next()) {
        if (!visitor(iter->value().ToString())) {
            break;
        }
    }

    if (!iter->status().ok()) {
        spdlog::error("[Store] Account iteration of wallet {} stopped: {}", walletID.ToString(),
                      iter->status().ToString());
        return false;
    }
    return true;
}

bool RocksDBStore::StoreAccountsIndex(const UUID& walletID, const std::string& data) {
    return Put(kIndexes, walletID.ToBytes(), data);
}

std::optional<std::string> RocksDBStore::RetrieveAccountsIndex(const UUID& walletID) const {
    return Get(kIndexes, walletID.ToBytes());
}

bool RocksDBStore::DeleteAccountsIndex(const UUID& walletID) {
    return Delete(kIndexes, walletID.ToBytes());
}
