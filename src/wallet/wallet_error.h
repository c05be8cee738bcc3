// Copyright (c) 2019 EPI-ONE Core Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef HDVAULT_WALLET_ERROR_H
#define HDVAULT_WALLET_ERROR_H

#include <cstdint>
#include <exception>
#include <string>

enum WalletErrc : uint8_t {
    kAlreadyExists = 1,
    kNotFound,
    kInvalidInput,
    kLockedWallet,
    kAuthenticationFailure,
    kCorruptState,
    kStorageFailure,
    kEncryptionFailure,
    kErrcNum,
};

std::string GetErrcStr(WalletErrc code);

/**
 * Raised by every wallet and account operation that cannot complete.
 * The code identifies the failure category, what() carries the detail.
 */
class WalletError : public std::exception {
public:
    WalletError(WalletErrc code, std::string message);

    const char* what() const noexcept override {
        return message_.c_str();
    }

    WalletErrc Code() const noexcept {
        return code_;
    }

private:
    WalletErrc code_;
    std::string message_;
};

#endif // HDVAULT_WALLET_ERROR_H
