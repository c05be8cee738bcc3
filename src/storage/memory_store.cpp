// Copyright (c) 2019 EPI-ONE Core Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "memory_store.h"

#include <mutex>
#include <vector>

bool MemoryStore::StoreWallet(const UUID& walletID, const std::string& walletName, const std::string& data) {
    std::unique_lock<std::shared_mutex> writer(mutex_);
    auto old = walletNames_.find(walletID);
    if (old != walletNames_.end() && old->second != walletName) {
        wallets_.erase(old->second);
    }
    wallets_[walletName]   = data;
    walletNames_[walletID] = walletName;
    return true;
}

std::optional<std::string> MemoryStore::RetrieveWallet(const std::string& walletName) const {
    std::shared_lock<std::shared_mutex> reader(mutex_);
    auto it = wallets_.find(walletName);
    if (it == wallets_.end()) {
        return {};
    }
    return it->second;
}

std::optional<std::string> MemoryStore::RetrieveWalletByID(const UUID& walletID) const {
    std::shared_lock<std::shared_mutex> reader(mutex_);
    auto name = walletNames_.find(walletID);
    if (name == walletNames_.end()) {
        return {};
    }
    auto it = wallets_.find(name->second);
    if (it == wallets_.end()) {
        return {};
    }
    return it->second;
}

bool MemoryStore::StoreAccount(const UUID& walletID, const UUID& accountID, const std::string& data) {
    std::unique_lock<std::shared_mutex> writer(mutex_);
    accounts_[walletID][accountID] = data;
    return true;
}

std::optional<std::string> MemoryStore::RetrieveAccount(const UUID& walletID, const UUID& accountID) const {
    std::shared_lock<std::shared_mutex> reader(mutex_);
    auto wallet = accounts_.find(walletID);
    if (wallet == accounts_.end()) {
        return {};
    }
    auto it = wallet->second.find(accountID);
    if (it == wallet->second.end()) {
        return {};
    }
    return it->second;
}

bool MemoryStore::RetrieveAccounts(const UUID& walletID, const AccountVisitor& visitor) const {
    std::vector<std::string> records;
    {
        // the visitor may block, so it runs on a snapshot
        std::shared_lock<std::shared_mutex> reader(mutex_);
        auto wallet = accounts_.find(walletID);
        if (wallet == accounts_.end()) {
            return true;
        }
        records.reserve(wallet->second.size());
        for (const auto& entry : wallet->second) {
            records.push_back(entry.second);
        }
    }

    for (const auto& data : records) {
        if (!visitor(data)) {
            break;
        }
    }
    return true;
}

bool MemoryStore::StoreAccountsIndex(const UUID& walletID, const std::string& data) {
    std::unique_lock<std::shared_mutex> writer(mutex_);
    indexes_[walletID] = data;
    return true;
}

std::optional<std::string> MemoryStore::RetrieveAccountsIndex(const UUID& walletID) const {
    std::shared_lock<std::shared_mutex> reader(mutex_);
    auto it = indexes_.find(walletID);
    if (it == indexes_.end()) {
        return {};
    }
    return it->second;
}

bool MemoryStore::DeleteAccountsIndex(const UUID& walletID) {
    std::unique_lock<std::shared_mutex> writer(mutex_);
    return indexes_.erase(walletID) > 0;
}

size_t MemoryStore::GetWalletCount() const {
    std::shared_lock<std::shared_mutex> reader(mutex_);
    return wallets_.size();
}

size_t MemoryStore::GetAccountCount(const UUID& walletID) const {
    std::shared_lock<std::shared_mutex> reader(mutex_);
    auto wallet = accounts_.find(walletID);
    return wallet == accounts_.end() ? 0 : wallet->second.size();
}
