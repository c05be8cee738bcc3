// Copyright (c) 2019 EPI-ONE Core Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef HDVAULT_MEMORY_STORE_H
#define HDVAULT_MEMORY_STORE_H

#include "wallet_store.h"

#include <map>
#include <shared_mutex>
#include <unordered_map>

/**
 * Scratch store kept in process memory, nothing survives the object.
 * Accounts of a wallet are visited in identifier order.
 */
class MemoryStore : public WalletStore {
public:
    MemoryStore() = default;
    MemoryStore(const MemoryStore&) = delete;
    MemoryStore& operator=(const MemoryStore&) = delete;

    std::string Name() const override {
        return "memory";
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

    size_t GetWalletCount() const;
    size_t GetAccountCount(const UUID& walletID) const;

private:
    mutable std::shared_mutex mutex_;

    std::unordered_map<std::string, std::string> wallets_;
    std::unordered_map<UUID, std::string> walletNames_;
    std::unordered_map<UUID, std::map<UUID, std::string>> accounts_;
    std::unordered_map<UUID, std::string> indexes_;
};

#endif // HDVAULT_MEMORY_STORE_H
