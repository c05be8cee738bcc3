// Copyright (c) 2019 EPI-ONE Core Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "account_stream.h"
#include "spdlog/spdlog.h"
#include "wallet.h"
#include "wallet_error.h"

AccountStream::AccountStream(const HDWallet& wallet, size_t capacity)
    : wallet_(wallet), queue_(capacity), skipped_(0), cancelled_(false), failed_(false) {
    producer_ = std::thread(&AccountStream::Produce, this);
}

AccountStream::~AccountStream() {
    Cancel();
    if (producer_.joinable()) {
        producer_.join();
    }
}

bool AccountStream::Next(AccountPtr& account) {
    return queue_.Take(account);
}

void AccountStream::Cancel() {
    cancelled_ = true;
    queue_.Quit();
}

void AccountStream::Produce() {
    try {
        auto owner = wallet_.shared_from_this();
        bool read  = wallet_.GetStore().RetrieveAccounts(wallet_.ID(), [this, &owner](const std::string& data) {
            if (cancelled_) {
                return false;
            }

            AccountPtr account;
            try {
                account = Account::Deserialize(data, owner);
            } catch (const WalletError& e) {
                ++skipped_;
                spdlog::debug("[Wallet] Skipping account record of wallet {}: {}", wallet_.Name(), e.what());
                return true;
            }
            return queue_.Put(std::move(account));
        });
        if (!read) {
            failed_ = true;
            spdlog::error("[Wallet] Account enumeration of wallet {} failed", wallet_.Name());
        }
    } catch (const std::exception& e) {
        failed_ = true;
        spdlog::error("[Wallet] Account enumeration of wallet {} failed: {}", wallet_.Name(), e.what());
    }

    if (skipped_ > 0) {
        spdlog::warn("[Wallet] Skipped {} undecodable account records of wallet {}", skipped_.load(), wallet_.Name());
    }
    queue_.Close();
}
