// Copyright (c) 2019 EPI-ONE Core Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <gtest/gtest.h>

#include "keypath.h"
#include "test_env.h"
#include "test_store.h"
#include "wallet.h"

#include <map>

class TestExport : public testing::Test {
public:
    const TestFactory& fac          = HDVaultTestEnvironment::GetFactory();
    const KeystoreEncryptor& crypt  = fac.GetEncryptor();
    const BundleCodec& codec        = fac.GetCodec();
    const SecureString passphrase   = fac.CreatePassphrase("wallet");
    const SecureString exportPass   = fac.CreatePassphrase("export");
    TestStore source;
    TestStore target;
    SecureByte seed = fac.CreateSeed();
    WalletPtr wallet;

    void SetUp() override {
        wallet = HDWallet::CreateWalletFromSeed("exported", 5, passphrase, source, crypt, seed);
        wallet->Unlock(passphrase);
        for (int i = 0; i < 4; ++i) {
            auto name = "account " + std::to_string(i);
            wallet->CreateAccount(name, fac.CreatePassphrase(name));
        }
    }

    // encrypts a hand made bundle the way Export does
    std::vector<unsigned char> Seal(const records::ExportBundle& bundle) {
        std::string json;
        EXPECT_TRUE(RecordToJson(bundle, json));
        std::vector<unsigned char> blob;
        EXPECT_TRUE(codec.Encrypt(json, exportPass, blob));
        return blob;
    }

    records::ExportBundle Open(const std::vector<unsigned char>& blob) {
        std::string json;
        EXPECT_TRUE(codec.Decrypt(blob, exportPass, json));
        records::ExportBundle bundle;
        EXPECT_TRUE(RecordFromJson(json, bundle));
        return bundle;
    }
};

TEST_F(TestExport, export_import_round_trip) {
    auto blob     = wallet->Export(exportPass, codec);
    auto imported = HDWallet::Import(blob, exportPass, target, crypt, DefaultKeyDeriver(), codec);

    EXPECT_EQ(imported->Name(), "exported");
    EXPECT_EQ(imported->ID(), wallet->ID());
    EXPECT_EQ(imported->WalletIndex(), 5);
    EXPECT_EQ(imported->NextAccount(), 4);
    EXPECT_EQ(imported->GetIndex(), wallet->GetIndex());
    EXPECT_FALSE(imported->IsUnlocked());

    imported->Unlock(passphrase);
    EXPECT_EQ(imported->Key(), seed);

    for (const auto& entry : wallet->GetIndex().GetEntries()) {
        auto original = wallet->AccountByName(entry.first);
        auto copy     = imported->AccountByName(entry.first);
        EXPECT_EQ(copy->ID(), original->ID());
        EXPECT_EQ(copy->Path(), original->Path());
        EXPECT_EQ(copy->PublicKey(), original->PublicKey());

        auto accountPass = fac.CreatePassphrase(entry.first);
        original->Unlock(accountPass);
        copy->Unlock(accountPass);
        EXPECT_EQ(copy->PrivateKey(), original->PrivateKey());
    }

    // the imported wallet is fully persisted
    auto reopened = HDWallet::OpenWallet("exported", target, crypt);
    EXPECT_EQ(reopened->GetIndex(), wallet->GetIndex());
    EXPECT_EQ(target.GetAccountCount(imported->ID()), 4);

    // and continues the account counter
    auto next = imported->CreateAccount("after import", passphrase);
    EXPECT_EQ(next->Path(), "m/12381/3600/5/4/0");
}

TEST_F(TestExport, export_locked_wallet) {
    wallet->Lock();
    auto blob = wallet->Export(exportPass, codec);

    auto bundle = Open(blob);
    EXPECT_EQ(bundle.wallet().name(), "exported");
    EXPECT_EQ(bundle.accounts_size(), 4);
}

TEST_F(TestExport, export_skips_undecodable_accounts) {
    source.StoreAccount(wallet->ID(), UUID::Random(), "garbage");

    auto bundle = Open(wallet->Export(exportPass, codec));
    EXPECT_EQ(bundle.accounts_size(), 4);
}

TEST_F(TestExport, export_read_failure) {
    source.failReadsAfter = 2;
    EXPECT_EQ(ErrcOf([&] { wallet->Export(exportPass, codec); }), kStorageFailure);

    source.throwOnRead = true;
    EXPECT_EQ(ErrcOf([&] { wallet->Export(exportPass, codec); }), kStorageFailure);

    source.failReadsAfter = -1;
    EXPECT_EQ(Open(wallet->Export(exportPass, codec)).accounts_size(), 4);
}

TEST_F(TestExport, import_with_other_rounds) {
    // the bundle names its own rounds, the importing codec's setting is irrelevant
    auto blob     = wallet->Export(exportPass, BundleCodec(TEST_KDF_ROUNDS));
    auto imported = HDWallet::Import(blob, exportPass, target, crypt, DefaultKeyDeriver(),
                                     BundleCodec(TEST_KDF_ROUNDS * 2));
    EXPECT_EQ(imported->GetIndex(), wallet->GetIndex());
    EXPECT_EQ(target.GetAccountCount(imported->ID()), 4);
}

TEST_F(TestExport, import_wrong_passphrase) {
    auto blob = wallet->Export(exportPass, codec);

    EXPECT_EQ(ErrcOf([&] {
                  HDWallet::Import(blob, fac.CreatePassphrase("wrong"), target, crypt, DefaultKeyDeriver(), codec);
              }),
              kAuthenticationFailure);

    blob[blob.size() / 2] ^= 0x01;
    EXPECT_EQ(ErrcOf([&] { HDWallet::Import(blob, exportPass, target, crypt, DefaultKeyDeriver(), codec); }),
              kAuthenticationFailure);

    EXPECT_EQ(ErrcOf([&] {
                  HDWallet::Import(std::vector<unsigned char>(), exportPass, target, crypt, DefaultKeyDeriver(), codec);
              }),
              kAuthenticationFailure);

    EXPECT_EQ(target.Writes(), 0);
}

TEST_F(TestExport, import_existing_wallet) {
    auto blob = wallet->Export(exportPass, codec);
    source.ResetCounters();

    EXPECT_EQ(ErrcOf([&] { HDWallet::Import(blob, exportPass, source, crypt, DefaultKeyDeriver(), codec); }),
              kAlreadyExists);
    EXPECT_EQ(source.Writes(), 0);

    HDWallet::Import(blob, exportPass, target, crypt, DefaultKeyDeriver(), codec);
    target.ResetCounters();
    EXPECT_EQ(ErrcOf([&] { HDWallet::Import(blob, exportPass, target, crypt, DefaultKeyDeriver(), codec); }),
              kAlreadyExists);
    EXPECT_EQ(target.Writes(), 0);
}

TEST_F(TestExport, import_rejects_duplicate_names) {
    auto bundle = Open(wallet->Export(exportPass, codec));
    records::AccountRecord clone = bundle.accounts(0);
    clone.set_uuid(UUID::Random().ToString());
    *bundle.add_accounts() = clone;

    EXPECT_EQ(ErrcOf([&] { HDWallet::Import(Seal(bundle), exportPass, target, crypt, DefaultKeyDeriver(), codec); }),
              kCorruptState);
    EXPECT_EQ(target.Writes(), 0);
    EXPECT_EQ(target.GetWalletCount(), 0);
}

TEST_F(TestExport, import_rejects_invalid_records) {
    auto bundle = Open(wallet->Export(exportPass, codec));

    // the last account is broken, nothing may be written for the others
    auto broken = bundle;
    broken.mutable_accounts(3)->clear_pubkey();
    EXPECT_EQ(ErrcOf([&] { HDWallet::Import(Seal(broken), exportPass, target, crypt, DefaultKeyDeriver(), codec); }),
              kCorruptState);

    broken = bundle;
    broken.mutable_wallet()->clear_crypto();
    EXPECT_EQ(ErrcOf([&] { HDWallet::Import(Seal(broken), exportPass, target, crypt, DefaultKeyDeriver(), codec); }),
              kCorruptState);

    broken = bundle;
    broken.mutable_wallet()->set_wallet_index(HARDENED_BIT);
    EXPECT_EQ(ErrcOf([&] { HDWallet::Import(Seal(broken), exportPass, target, crypt, DefaultKeyDeriver(), codec); }),
              kCorruptState);

    broken = bundle;
    broken.clear_wallet();
    EXPECT_EQ(ErrcOf([&] { HDWallet::Import(Seal(broken), exportPass, target, crypt, DefaultKeyDeriver(), codec); }),
              kCorruptState);

    std::vector<unsigned char> notJson;
    ASSERT_TRUE(codec.Encrypt("this is not json", exportPass, notJson));
    EXPECT_EQ(ErrcOf([&] { HDWallet::Import(notJson, exportPass, target, crypt, DefaultKeyDeriver(), codec); }),
              kCorruptState);

    EXPECT_EQ(target.Writes(), 0);
}

TEST_F(TestExport, import_storage_failure_leaves_partial_wallet) {
    auto blob = wallet->Export(exportPass, codec);

    target.failAccount = true;
    EXPECT_EQ(ErrcOf([&] { HDWallet::Import(blob, exportPass, target, crypt, DefaultKeyDeriver(), codec); }),
              kStorageFailure);

    // the wallet record went in first and stays
    EXPECT_TRUE(target.RetrieveWallet("exported"));
    EXPECT_EQ(target.GetAccountCount(wallet->ID()), 0);
}

TEST_F(TestExport, import_empty_wallet) {
    TestStore emptySource;
    auto empty = HDWallet::CreateWallet("empty", passphrase, emptySource, crypt);

    auto imported = HDWallet::Import(empty->Export(exportPass, codec), exportPass, target, crypt,
                                     DefaultKeyDeriver(), codec);
    EXPECT_EQ(imported->Name(), "empty");
    EXPECT_TRUE(imported->GetIndex().Empty());
    EXPECT_TRUE(target.RetrieveAccountsIndex(imported->ID()));
}
