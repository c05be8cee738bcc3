// Copyright (c) 2019 EPI-ONE Core Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "account.h"
#include "spdlog/spdlog.h"
#include "strencodings.h"
#include "wallet.h"
#include "wallet_error.h"

Account::Account(std::weak_ptr<const HDWallet> wallet,
                 const UUID& id,
                 std::string name,
                 std::string path,
                 std::vector<unsigned char> pubkey,
                 CryptoPayload crypto,
                 std::string encryptor,
                 uint32_t version)
    : wallet_(std::move(wallet)),
      id_(id),
      name_(std::move(name)),
      path_(std::move(path)),
      pubkey_(std::move(pubkey)),
      crypto_(std::move(crypto)),
      encryptor_(std::move(encryptor)),
      version_(version) {}

Account::~Account() {
    Lock();
}

void Account::Unlock(const SecureString& passphrase) {
    auto wallet = wallet_.lock();
    if (!wallet) {
        throw WalletError(kNotFound, "wallet of account " + name_ + " no longer available");
    }

    SecureByte secret;
    std::vector<unsigned char> pubkey;
    if (!wallet->GetEncryptor().Decrypt(crypto_, passphrase, secret) ||
        !wallet->GetKeyDeriver().PublicKey(secret, pubkey) || pubkey != pubkey_) {
        throw WalletError(kAuthenticationFailure, "incorrect passphrase");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    secret_ = std::move(secret);
}

void Account::Lock() {
    std::lock_guard<std::mutex> lock(mutex_);
    memory_cleanse(secret_.data(), secret_.size());
    secret_.clear();
}

bool Account::IsUnlocked() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !secret_.empty();
}

SecureByte Account::PrivateKey() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (secret_.empty()) {
        throw WalletError(kLockedWallet, "account " + name_ + " must be unlocked to provide private key");
    }
    return secret_;
}

void Account::SetSecret(SecureByte secret) {
    std::lock_guard<std::mutex> lock(mutex_);
    secret_ = std::move(secret);
}

records::AccountRecord Account::ToRecord() const {
    records::AccountRecord record;
    record.set_uuid(id_.ToString());
    record.set_name(name_);
    record.set_pubkey(HexStr(pubkey_));
    record.set_path(path_);
    *record.mutable_crypto() = crypto_;
    record.set_encryptor(encryptor_);
    record.set_version(version_);
    return record;
}

std::string Account::Serialize() const {
    std::string json;
    if (!RecordToJson(ToRecord(), json)) {
        throw WalletError(kCorruptState, "failed to serialize account " + name_);
    }
    return json;
}

std::shared_ptr<Account> Account::FromRecord(const records::AccountRecord& record,
                                             std::weak_ptr<const HDWallet> wallet) {
    // the legacy "id" spelling is read when "uuid" is absent
    if (!record.has_uuid() && !record.has_id()) {
        throw WalletError(kCorruptState, "account ID missing");
    }
    auto id = UUID::FromString(record.has_uuid() ? record.uuid() : record.id());
    if (!id) {
        throw WalletError(kCorruptState, "account ID invalid");
    }

    if (!record.has_name()) {
        throw WalletError(kCorruptState, "account name missing");
    }
    if (record.name().empty()) {
        throw WalletError(kCorruptState, "account name invalid");
    }

    if (!record.has_pubkey()) {
        throw WalletError(kCorruptState, "account pubkey missing");
    }
    auto pubkey = ParseHex(record.pubkey());
    if (!pubkey || pubkey->empty()) {
        throw WalletError(kCorruptState, "account pubkey invalid");
    }

    if (!record.has_path()) {
        throw WalletError(kCorruptState, "account path missing");
    }
    if (!record.has_crypto()) {
        throw WalletError(kCorruptState, "account crypto missing");
    }
    if (!record.has_version()) {
        throw WalletError(kCorruptState, "account version missing");
    }

    return std::make_shared<Account>(std::move(wallet), *id, record.name(), record.path(), std::move(*pubkey), record.crypto(),
                                     record.encryptor(), record.version());
}

std::shared_ptr<Account> Account::Deserialize(const std::string& data, std::weak_ptr<const HDWallet> wallet) {
    records::AccountRecord record;
    if (!RecordFromJson(data, record)) {
        throw WalletError(kCorruptState, "account record invalid");
    }
    return FromRecord(record, std::move(wallet));
}
