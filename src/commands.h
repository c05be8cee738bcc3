// Copyright (c) 2019 EPI-ONE Core Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef HDVAULT_COMMANDS_H
#define HDVAULT_COMMANDS_H

#include "bundle_codec.h"
#include "config.h"
#include "crypter.h"
#include "wallet.h"

#include <functional>
#include <istream>
#include <map>
#include <ostream>

/**
 * The one-shot commands of the hdvault executable. Every command reads
 * its arguments from the config; passphrases that were not given on the
 * command line are read from the input stream.
 */
class Commands {
public:
    Commands(WalletStore& store, const Config& config, std::istream& in);

    /** Exit code of the command named in the config */
    int Run(std::ostream& out);

    void CreateWallet(std::ostream& out);
    void CreateAccount(std::ostream& out);
    void ListAccounts(std::ostream& out);
    void ShowAccount(std::ostream& out);
    void Export(std::ostream& out);
    void Import(std::ostream& out);

private:
    SecureString InputPassphrase(std::ostream& out,
                                 const std::string& prompt,
                                 const std::optional<SecureString>& given);
    std::shared_ptr<HDWallet> OpenWallet();
    void PrintAccount(std::ostream& out, const Account& account) const;

    WalletStore& store_;
    const Config& config_;
    std::istream& in_;
    KeystoreEncryptor encryptor_;
    BundleCodec codec_;
    std::map<std::string, std::function<void(std::ostream&)>> handlers_;
};

#endif // HDVAULT_COMMANDS_H
