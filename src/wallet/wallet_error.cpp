// Copyright (c) 2019 EPI-ONE Core Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "wallet_error.h"

std::string GetErrcStr(WalletErrc code) {
    static const std::string errcStr[] = {
        "UNKNOWN",
        "ALREADY_EXISTS",
        "NOT_FOUND",
        "INVALID_INPUT",
        "LOCKED_WALLET",
        "AUTHENTICATION_FAILURE",
        "CORRUPT_STATE",
        "STORAGE_FAILURE",
        "ENCRYPTION_FAILURE",
    };
    if (code >= kErrcNum) {
        return errcStr[0];
    }
    return errcStr[code];
}

WalletError::WalletError(WalletErrc code, std::string message) : code_(code), message_(std::move(message)) {}
