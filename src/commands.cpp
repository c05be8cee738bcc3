// Copyright (c) 2019 EPI-ONE Core Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "commands.h"
#include "file_utils.h"
#include "init.h"
#include "strencodings.h"

#include <iostream>
#include <termios.h>
#include <unistd.h>

namespace {
// hides typed characters while a passphrase is read from a terminal
class EchoGuard {
public:
    explicit EchoGuard(std::istream& in) : active_(&in == &std::cin && isatty(STDIN_FILENO)) {
        if (active_ && tcgetattr(STDIN_FILENO, &saved_) == 0) {
            termios silent = saved_;
            silent.c_lflag &= ~ECHO;
            tcsetattr(STDIN_FILENO, TCSANOW, &silent);
        } else {
            active_ = false;
        }
    }

    ~EchoGuard() {
        if (active_) {
            tcsetattr(STDIN_FILENO, TCSANOW, &saved_);
        }
    }

private:
    bool active_;
    termios saved_{};
};
} // namespace

Commands::Commands(WalletStore& store, const Config& config, std::istream& in)
    : store_(store), config_(config), in_(in), encryptor_(config.GetKdfRounds()), codec_(config.GetExportRounds()) {
    handlers_ = {
        {"create-wallet", [this](std::ostream& out) { CreateWallet(out); }},
        {"create-account", [this](std::ostream& out) { CreateAccount(out); }},
        {"list-accounts", [this](std::ostream& out) { ListAccounts(out); }},
        {"show-account", [this](std::ostream& out) { ShowAccount(out); }},
        {"export", [this](std::ostream& out) { Export(out); }},
        {"import", [this](std::ostream& out) { Import(out); }},
    };
}

int Commands::Run(std::ostream& out) {
    auto handler = handlers_.find(config_.GetCommand());
    if (handler == handlers_.end()) {
        std::cerr << "unknown command \"" << config_.GetCommand() << "\"" << std::endl;
        return COMMANDLINE_INIT_FAILURE;
    }

    try {
        handler->second(out);
    } catch (const WalletError& e) {
        spdlog::debug("{} failed with {}", config_.GetCommand(), GetErrcStr(e.Code()));
        std::cerr << e.what() << std::endl;
        return COMMAND_FAILURE;
    } catch (const std::exception& e) {
        spdlog::error("{} failed: {}", config_.GetCommand(), e.what());
        std::cerr << e.what() << std::endl;
        return COMMAND_FAILURE;
    }
    return NORMAL_EXIT;
}

SecureString Commands::InputPassphrase(std::ostream& out,
                                       const std::string& prompt,
                                       const std::optional<SecureString>& given) {
    if (given) {
        return *given;
    }

    out << prompt;
    std::string line;
    {
        EchoGuard guard(in_);
        std::getline(in_, line);
    }
    out << std::endl;

    SecureString passphrase(line.begin(), line.end());
    memory_cleanse(&line[0], line.size());
    return passphrase;
}

std::shared_ptr<HDWallet> Commands::OpenWallet() {
    if (config_.GetWalletName().empty()) {
        throw WalletError(kInvalidInput, "wallet name missing");
    }
    return HDWallet::OpenWallet(config_.GetWalletName(), store_, encryptor_);
}

void Commands::PrintAccount(std::ostream& out, const Account& account) const {
    out << account.Name() << std::endl;
    out << "  id     = " << account.ID().ToString() << std::endl;
    out << "  path   = " << account.Path() << std::endl;
    out << "  pubkey = " << HexStr(account.PublicKey()) << std::endl;
}

void Commands::CreateWallet(std::ostream& out) {
    const auto& name = config_.GetWalletName();
    auto passphrase  = InputPassphrase(out, "Wallet passphrase:", config_.GetPassphrase());

    std::shared_ptr<HDWallet> wallet;
    if (config_.GetSeedHex().empty()) {
        wallet = HDWallet::CreateWallet(name, passphrase, store_, encryptor_);
    } else {
        auto seed = ParseHex(config_.GetSeedHex());
        if (!seed) {
            throw WalletError(kInvalidInput, "seed must be hex encoded");
        }
        SecureByte secureSeed(seed->begin(), seed->end());
        memory_cleanse(seed->data(), seed->size());
        wallet = HDWallet::CreateWalletFromSeed(name, config_.GetWalletIndex(), passphrase, store_, encryptor_,
                                                secureSeed);
    }

    out << "created wallet " << wallet->Name() << " (" << wallet->ID().ToString() << ")" << std::endl;
}

void Commands::CreateAccount(std::ostream& out) {
    auto wallet = OpenWallet();
    wallet->Unlock(InputPassphrase(out, "Wallet passphrase:", config_.GetPassphrase()));
    auto account = wallet->CreateAccount(config_.GetAccountName(),
                                         InputPassphrase(out, "Account passphrase:", config_.GetAccountPassphrase()));
    wallet->Lock();

    PrintAccount(out, *account);
}

void Commands::ListAccounts(std::ostream& out) {
    auto wallet = OpenWallet();
    auto stream = wallet->Accounts(config_.GetStreamCapacity());

    AccountPtr account;
    while (stream->Next(account)) {
        out << account->Name() << "\t" << account->ID().ToString() << "\t" << account->Path() << std::endl;
    }
    if (stream->Failed()) {
        throw WalletError(kStorageFailure, "failed to read accounts of wallet \"" + wallet->Name() + "\"");
    }
    if (stream->Skipped() > 0) {
        std::cerr << stream->Skipped() << " account records could not be read" << std::endl;
    }
}

void Commands::ShowAccount(std::ostream& out) {
    auto wallet = OpenWallet();
    const auto& name = config_.GetAccountName();

    // derivation paths need the seed
    if (name.compare(0, HDWallet::PATH_PREFIX.size(), HDWallet::PATH_PREFIX) == 0) {
        wallet->Unlock(InputPassphrase(out, "Wallet passphrase:", config_.GetPassphrase()));
    }
    auto account = wallet->AccountByName(name);
    wallet->Lock();

    PrintAccount(out, *account);
}

void Commands::Export(std::ostream& out) {
    if (config_.GetFilePath().empty()) {
        throw WalletError(kInvalidInput, "export file missing");
    }

    auto wallet = OpenWallet();
    auto blob   = wallet->Export(InputPassphrase(out, "Export passphrase:", config_.GetExportPassphrase()), codec_);
    if (!WriteBinaryFile(config_.GetFilePath(), blob)) {
        throw WalletError(kStorageFailure, "failed to write " + config_.GetFilePath());
    }

    out << "exported wallet " << wallet->Name() << " to " << config_.GetFilePath() << std::endl;
}

void Commands::Import(std::ostream& out) {
    auto blob = ReadBinaryFile(config_.GetFilePath());
    if (!blob) {
        throw WalletError(kNotFound, "failed to read " + config_.GetFilePath());
    }

    auto wallet = HDWallet::Import(*blob, InputPassphrase(out, "Export passphrase:", config_.GetExportPassphrase()),
                                   store_, encryptor_, DefaultKeyDeriver(), codec_);

    out << "imported wallet " << wallet->Name() << " (" << wallet->ID().ToString() << ")" << std::endl;
}
