// Copyright (c) 2019 EPI-ONE Core Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef HDVAULT_WALLET_STORE_H
#define HDVAULT_WALLET_STORE_H

#include "uuid.h"

#include <functional>
#include <optional>
#include <string>

/**
 * Persistence of wallet records, account records and name indexes.
 * Records are opaque serialized blobs. Writes report success with a
 * bool, reads return an empty optional when the key is absent.
 *
 * Implementations must tolerate concurrent calls: an account stream
 * reads from its own thread while the owner keeps writing.
 */
class WalletStore {
public:
    // return false to stop the iteration
    using AccountVisitor = std::function<bool(const std::string&)>;

    virtual ~WalletStore() = default;

    virtual std::string Name() const = 0;

    virtual bool StoreWallet(const UUID& walletID, const std::string& walletName, const std::string& data) = 0;
    virtual std::optional<std::string> RetrieveWallet(const std::string& walletName) const = 0;
    virtual std::optional<std::string> RetrieveWalletByID(const UUID& walletID) const = 0;

    virtual bool StoreAccount(const UUID& walletID, const UUID& accountID, const std::string& data) = 0;
    virtual std::optional<std::string> RetrieveAccount(const UUID& walletID, const UUID& accountID) const = 0;
    /**
     * Visits the account records of a wallet. Returns false when the
     * store could not read all of them; a visitor stopping early is not
     * a failure.
     */
    virtual bool RetrieveAccounts(const UUID& walletID, const AccountVisitor& visitor) const = 0;

    virtual bool StoreAccountsIndex(const UUID& walletID, const std::string& data) = 0;
    virtual std::optional<std::string> RetrieveAccountsIndex(const UUID& walletID) const = 0;
};

#endif // HDVAULT_WALLET_STORE_H
