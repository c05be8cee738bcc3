// Copyright (c) 2019 EPI-ONE Core Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "wallet.h"
#include "keypath.h"
#include "random.h"
#include "spdlog/spdlog.h"
#include "strencodings.h"

#include <mutex>

namespace {
std::string Quote(const std::string& str) {
    return "\"" + str + "\"";
}
} // namespace

HDWallet::HDWallet(WalletStore& store, const Encryptor& encryptor, const KeyDeriver& deriver)
    : version_(VERSION),
      walletIndex_(0),
      nextAccount_(0),
      store_(store),
      encryptor_(encryptor),
      deriver_(deriver) {}

HDWallet::~HDWallet() {
    memory_cleanse(seed_.data(), seed_.size());
}

bool HDWallet::IsReservedName(const std::string& name) {
    return !name.empty() && (name[0] == RESERVED_PREFIX || name.compare(0, PATH_PREFIX.size(), PATH_PREFIX) == 0);
}

void HDWallet::CheckNewWallet(const std::string& name, const WalletStore& store) {
    if (name.empty()) {
        throw WalletError(kInvalidInput, "wallet name missing");
    }
    if (!IsValidUTF8(name)) {
        throw WalletError(kInvalidInput, "invalid wallet name " + Quote(name));
    }
    if (store.RetrieveWallet(name)) {
        throw WalletError(kAlreadyExists, "wallet " + Quote(name) + " already exists");
    }
}

std::shared_ptr<HDWallet> HDWallet::CreateWallet(const std::string& name,
                                                 const SecureString& passphrase,
                                                 WalletStore& store,
                                                 const Encryptor& encryptor,
                                                 const KeyDeriver& deriver) {
    CheckNewWallet(name, store);

    SecureByte seed;
    if (!GetSecureRand(seed, SEED_SIZE)) {
        throw WalletError(kEncryptionFailure, "failed to generate seed for wallet " + Quote(name));
    }
    return CreateWalletFromSeed(name, 0, passphrase, store, encryptor, seed, deriver);
}

std::shared_ptr<HDWallet> HDWallet::CreateWalletFromSeed(const std::string& name,
                                                         uint32_t walletIndex,
                                                         const SecureString& passphrase,
                                                         WalletStore& store,
                                                         const Encryptor& encryptor,
                                                         const SecureByte& seed,
                                                         const KeyDeriver& deriver) {
    CheckNewWallet(name, store);
    if (seed.size() != SEED_SIZE) {
        throw WalletError(kInvalidInput, "seed must be 32 bytes");
    }
    if (walletIndex & HARDENED_BIT) {
        throw WalletError(kInvalidInput, "wallet index " + std::to_string(walletIndex) + " out of range");
    }

    std::shared_ptr<HDWallet> wallet(new HDWallet(store, encryptor, deriver));
    wallet->id_          = UUID::Random();
    wallet->name_        = name;
    wallet->walletIndex_ = walletIndex;
    if (!encryptor.Encrypt(seed, passphrase, wallet->crypto_)) {
        throw WalletError(kEncryptionFailure, "failed to encrypt seed of wallet " + Quote(name));
    }

    wallet->StoreAccountsIndex();
    wallet->StoreWallet();

    spdlog::info("[Wallet] Created wallet {} ({}) on {} store", name, wallet->id_.ToString(), store.Name());
    return wallet;
}

std::shared_ptr<HDWallet> HDWallet::OpenWallet(const std::string& name,
                                               WalletStore& store,
                                               const Encryptor& encryptor,
                                               const KeyDeriver& deriver) {
    auto data = store.RetrieveWallet(name);
    if (!data) {
        throw WalletError(kNotFound, "wallet " + Quote(name) + " not found");
    }
    return DeserializeWallet(*data, store, encryptor, deriver);
}

std::shared_ptr<HDWallet> HDWallet::DeserializeWallet(const std::string& data,
                                                      WalletStore& store,
                                                      const Encryptor& encryptor,
                                                      const KeyDeriver& deriver) {
    records::WalletRecord record;
    if (!RecordFromJson(data, record)) {
        throw WalletError(kCorruptState, "wallet record invalid");
    }

    std::shared_ptr<HDWallet> wallet(new HDWallet(store, encryptor, deriver));
    wallet->FromRecord(record);
    wallet->RetrieveAccountsIndex();
    return wallet;
}

std::shared_ptr<HDWallet> HDWallet::Import(const std::vector<unsigned char>& blob,
                                           const SecureString& passphrase,
                                           WalletStore& store,
                                           const Encryptor& encryptor,
                                           const KeyDeriver& deriver,
                                           const BundleCodec& codec) {
    std::string json;
    if (!codec.Decrypt(blob, passphrase, json)) {
        throw WalletError(kAuthenticationFailure, "incorrect passphrase");
    }

    records::ExportBundle bundle;
    bool parsed = RecordFromJson(json, bundle);
    memory_cleanse(&json[0], json.size());
    if (!parsed) {
        throw WalletError(kCorruptState, "export data invalid");
    }
    if (!bundle.has_wallet()) {
        throw WalletError(kCorruptState, "export wallet missing");
    }

    std::shared_ptr<HDWallet> wallet(new HDWallet(store, encryptor, deriver));
    wallet->FromRecord(bundle.wallet());

    // everything is checked before the first write
    NameIndex names;
    std::vector<AccountPtr> accounts;
    accounts.reserve(bundle.accounts_size());
    for (const auto& record : bundle.accounts()) {
        auto account = Account::FromRecord(record, wallet);
        if (!names.Add(account->ID(), account->Name())) {
            throw WalletError(kCorruptState, "duplicate account " + Quote(account->Name()) + " in export data");
        }
        accounts.push_back(std::move(account));
    }

    if (store.RetrieveWallet(wallet->name_)) {
        throw WalletError(kAlreadyExists, "wallet " + Quote(wallet->name_) + " already exists");
    }

    wallet->StoreWallet();
    for (const auto& account : accounts) {
        if (!store.StoreAccount(wallet->id_, account->ID(), account->Serialize())) {
            throw WalletError(kStorageFailure, "failed to store account " + Quote(account->Name()));
        }
        wallet->index_.Add(account->ID(), account->Name());
    }
    wallet->StoreAccountsIndex();

    spdlog::info("[Wallet] Imported wallet {} with {} accounts", wallet->name_, accounts.size());
    return wallet;
}

uint32_t HDWallet::NextAccount() const {
    std::shared_lock<std::shared_mutex> reader(lock_);
    return nextAccount_;
}

void HDWallet::Lock() {
    std::unique_lock<std::shared_mutex> writer(lock_);
    memory_cleanse(seed_.data(), seed_.size());
    seed_.clear();
}

void HDWallet::Unlock(const SecureString& passphrase) {
    std::unique_lock<std::shared_mutex> writer(lock_);
    SecureByte seed;
    if (!encryptor_.Decrypt(crypto_, passphrase, seed) || seed.size() != SEED_SIZE) {
        throw WalletError(kAuthenticationFailure, "incorrect passphrase");
    }
    seed_ = std::move(seed);
    spdlog::debug("[Wallet] Unlocked wallet {}", name_);
}

bool HDWallet::IsUnlocked() const {
    std::shared_lock<std::shared_mutex> reader(lock_);
    return !seed_.empty();
}

SecureByte HDWallet::Key() const {
    std::shared_lock<std::shared_mutex> reader(lock_);
    if (seed_.empty()) {
        throw WalletError(kLockedWallet, "wallet must be unlocked to provide seed");
    }
    return seed_;
}

AccountPtr HDWallet::CreateAccount(const std::string& name, const SecureString& passphrase) {
    if (name.empty()) {
        throw WalletError(kInvalidInput, "account name missing");
    }
    if (IsReservedName(name) || !IsValidUTF8(name)) {
        throw WalletError(kInvalidInput, "invalid account name " + Quote(name));
    }

    std::unique_lock<std::shared_mutex> writer(lock_);
    if (seed_.empty()) {
        throw WalletError(kLockedWallet, "wallet must be unlocked to create accounts");
    }
    if (index_.Contains(name)) {
        throw WalletError(kAlreadyExists, "account with name " + Quote(name) + " already exists");
    }
    if (nextAccount_ & HARDENED_BIT) {
        throw WalletError(kInvalidInput, "wallet " + Quote(name_) + " has no account numbers left");
    }

    // the counter hits the store before any key exists for it
    uint32_t accountNum = nextAccount_++;
    StoreWallet();

    std::string path = AccountKeypath(walletIndex_, accountNum);
    KeyPair keys;
    if (!deriver_.DeriveKeyPair(seed_, path, keys)) {
        throw WalletError(kInvalidInput, "failed to create private key for account " + Quote(name));
    }

    CryptoPayload crypto;
    if (!encryptor_.Encrypt(keys.secret, passphrase, crypto)) {
        throw WalletError(kEncryptionFailure, "failed to encrypt private key for account " + Quote(name));
    }

    auto account = std::make_shared<Account>(shared_from_this(), UUID::Random(), name, path,
                                             std::move(keys.pubkey), std::move(crypto), encryptor_.Name(),
                                             encryptor_.Version());
    std::string data = account->Serialize();

    index_.Add(account->ID(), name);
    if (!store_.StoreAccount(id_, account->ID(), data)) {
        index_.Remove(account->ID());
        throw WalletError(kStorageFailure, "failed to store account " + Quote(name));
    }
    StoreAccountsIndex();

    spdlog::info("[Wallet] Created account {} at {} in wallet {}", name, path, name_);
    return account;
}

AccountPtr HDWallet::AccountByName(const std::string& name) const {
    std::shared_lock<std::shared_mutex> reader(lock_);
    if (name.compare(0, PATH_PREFIX.size(), PATH_PREFIX) == 0) {
        return ProgrammaticAccount(name);
    }

    auto id = index_.GetID(name);
    if (!id) {
        throw WalletError(kNotFound, "no account with name " + Quote(name));
    }
    return LoadAccount(*id);
}

AccountPtr HDWallet::AccountByID(const UUID& id) const {
    return LoadAccount(id);
}

AccountPtr HDWallet::LoadAccount(const UUID& id) const {
    auto data = store_.RetrieveAccount(id_, id);
    if (!data) {
        throw WalletError(kNotFound, "no account with ID " + id.ToString());
    }
    return Account::Deserialize(*data, shared_from_this());
}

AccountPtr HDWallet::ProgrammaticAccount(const std::string& path) const {
    if (seed_.empty()) {
        throw WalletError(kLockedWallet, "wallet must be unlocked to compute account " + Quote(path));
    }

    KeyPair keys;
    if (!deriver_.DeriveKeyPair(seed_, path, keys)) {
        throw WalletError(kInvalidInput, "failed to create private key for path " + Quote(path));
    }

    // encrypted with an empty passphrase
    CryptoPayload crypto;
    if (!encryptor_.Encrypt(keys.secret, SecureString(), crypto)) {
        throw WalletError(kEncryptionFailure, "failed to encrypt private key for path " + Quote(path));
    }

    auto account = std::make_shared<Account>(shared_from_this(), UUID::Random(), path, path,
                                             std::move(keys.pubkey), std::move(crypto), encryptor_.Name(),
                                             encryptor_.Version());
    account->SetSecret(std::move(keys.secret));
    return account;
}

std::unique_ptr<AccountStream> HDWallet::Accounts(size_t capacity) const {
    return std::make_unique<AccountStream>(*this, capacity);
}

std::vector<unsigned char> HDWallet::Export(const SecureString& passphrase, const BundleCodec& codec) const {
    std::shared_lock<std::shared_mutex> reader(lock_);

    records::ExportBundle bundle;
    *bundle.mutable_wallet() = ToRecord();

    auto stream = Accounts();
    AccountPtr account;
    while (stream->Next(account)) {
        *bundle.add_accounts() = account->ToRecord();
    }
    if (stream->Failed()) {
        throw WalletError(kStorageFailure, "failed to read accounts of wallet " + Quote(name_));
    }
    if (stream->Skipped() > 0) {
        spdlog::warn("[Wallet] Export of wallet {} leaves out {} undecodable accounts", name_, stream->Skipped());
    }

    std::string json;
    if (!RecordToJson(bundle, json)) {
        throw WalletError(kCorruptState, "failed to serialize wallet " + Quote(name_));
    }

    std::vector<unsigned char> blob;
    bool encrypted = codec.Encrypt(json, passphrase, blob);
    memory_cleanse(&json[0], json.size());
    if (!encrypted) {
        throw WalletError(kEncryptionFailure, "failed to encrypt export of wallet " + Quote(name_));
    }

    spdlog::info("[Wallet] Exported wallet {} with {} accounts", name_, bundle.accounts_size());
    return blob;
}

NameIndex HDWallet::GetIndex() const {
    std::shared_lock<std::shared_mutex> reader(lock_);
    return index_;
}

records::WalletRecord HDWallet::ToRecord() const {
    records::WalletRecord record;
    record.set_uuid(id_.ToString());
    record.set_name(name_);
    record.set_type(TYPE);
    *record.mutable_crypto() = crypto_;
    record.set_wallet_index(walletIndex_);
    record.set_next_account(nextAccount_);
    record.set_version(version_);
    return record;
}

std::string HDWallet::Serialize() const {
    std::shared_lock<std::shared_mutex> reader(lock_);
    std::string json;
    if (!RecordToJson(ToRecord(), json)) {
        throw WalletError(kCorruptState, "failed to serialize wallet " + Quote(name_));
    }
    return json;
}

void HDWallet::FromRecord(const records::WalletRecord& record) {
    if (!record.has_type()) {
        throw WalletError(kCorruptState, "wallet type missing");
    }
    if (record.type() != TYPE) {
        throw WalletError(kCorruptState, "wallet type " + Quote(record.type()) + " unexpected");
    }

    // the legacy "id" spelling is read when "uuid" is absent
    if (!record.has_uuid() && !record.has_id()) {
        throw WalletError(kCorruptState, "wallet ID missing");
    }
    auto id = UUID::FromString(record.has_uuid() ? record.uuid() : record.id());
    if (!id) {
        throw WalletError(kCorruptState, "wallet ID invalid");
    }

    if (!record.has_name()) {
        throw WalletError(kCorruptState, "wallet name missing");
    }
    if (record.name().empty()) {
        throw WalletError(kCorruptState, "wallet name invalid");
    }
    if (!record.has_crypto()) {
        throw WalletError(kCorruptState, "wallet crypto missing");
    }
    if (!record.has_wallet_index()) {
        throw WalletError(kCorruptState, "wallet index missing");
    }
    if (record.wallet_index() & HARDENED_BIT) {
        throw WalletError(kCorruptState, "wallet index invalid");
    }
    if (!record.has_next_account()) {
        throw WalletError(kCorruptState, "wallet next account missing");
    }
    // one past the last normal child is allowed, CreateAccount refuses it
    if (record.next_account() > HARDENED_BIT) {
        throw WalletError(kCorruptState, "wallet next account invalid");
    }
    if (!record.has_version()) {
        throw WalletError(kCorruptState, "wallet version missing");
    }

    id_          = *id;
    name_        = record.name();
    crypto_      = record.crypto();
    walletIndex_ = record.wallet_index();
    nextAccount_ = record.next_account();
    version_     = record.version();
}

void HDWallet::StoreWallet() const {
    std::string data;
    if (!RecordToJson(ToRecord(), data)) {
        throw WalletError(kCorruptState, "failed to serialize wallet " + Quote(name_));
    }
    if (!store_.StoreWallet(id_, name_, data)) {
        throw WalletError(kStorageFailure, "failed to store wallet " + Quote(name_));
    }
}

void HDWallet::StoreAccountsIndex() const {
    if (!store_.StoreAccountsIndex(id_, index_.Serialize())) {
        throw WalletError(kStorageFailure, "failed to store accounts index of wallet " + Quote(name_));
    }
}

void HDWallet::RetrieveAccountsIndex() {
    auto data = store_.RetrieveAccountsIndex(id_);
    if (data) {
        auto index = NameIndex::Deserialize(*data);
        if (index) {
            index_ = std::move(*index);
            return;
        }
        spdlog::warn("[Wallet] Accounts index of wallet {} is malformed, rebuilding", name_);
    } else {
        spdlog::info("[Wallet] Accounts index of wallet {} is missing, rebuilding", name_);
    }

    NameIndex rebuilt;
    size_t duplicates = 0;
    auto stream       = Accounts();
    AccountPtr account;
    while (stream->Next(account)) {
        if (!rebuilt.Add(account->ID(), account->Name())) {
            ++duplicates;
            spdlog::warn("[Wallet] Skipping account {} of wallet {}: name {} already indexed",
                         account->ID().ToString(), name_, account->Name());
        }
    }
    if (stream->Failed()) {
        throw WalletError(kStorageFailure, "failed to read accounts of wallet " + Quote(name_));
    }
    index_ = std::move(rebuilt);

    spdlog::info("[Wallet] Rebuilt accounts index of wallet {} with {} entries, skipped {} undecodable and {} "
                 "duplicate records",
                 name_, index_.Size(), stream->Skipped(), duplicates);
    StoreAccountsIndex();
}
