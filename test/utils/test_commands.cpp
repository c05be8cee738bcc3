// Copyright (c) 2019 EPI-ONE Core Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <gtest/gtest.h>

#include "commands.h"
#include "file_utils.h"
#include "init.h"
#include "test_env.h"
#include "test_store.h"

#include <sstream>

class TestCommands : public testing::Test {
public:
    const TestFactory& fac = HDVaultTestEnvironment::GetFactory();
    TestStore store;
    Config config;
    std::string dir;

    void SetUp() override {
        dir = HDVaultTestEnvironment::TempDir("test_commands_");
        ASSERT_TRUE(MkdirRecursive(dir));
        config.SetKdfRounds(TEST_KDF_ROUNDS);
        config.SetExportRounds(TEST_KDF_ROUNDS);
    }

    void TearDown() override {
        HDVaultTestEnvironment::RemoveDir(dir);
    }

    int Run(const std::string& command, std::string& output, const std::string& input = "") {
        return Run(store, command, output, input);
    }

    int Run(WalletStore& target, const std::string& command, std::string& output, const std::string& input = "") {
        config.SetCommand(command);
        std::istringstream in(input);
        std::ostringstream out;
        Commands commands(target, config, in);
        int code = commands.Run(out);
        output   = out.str();
        return code;
    }
};

TEST_F(TestCommands, wallet_and_accounts) {
    std::string output;
    config.SetWalletName("cli");
    config.SetPassphrase(fac.CreatePassphrase("pass"));
    config.SetSeedHex(std::string(64, '7'));
    config.SetWalletIndex(2);

    ASSERT_EQ(Run("create-wallet", output), NORMAL_EXIT);
    EXPECT_EQ(output.find("created wallet cli"), 0);
    EXPECT_EQ(HDWallet::OpenWallet("cli", store, fac.GetEncryptor())->WalletIndex(), 2);

    // creating it again fails without touching it
    EXPECT_EQ(Run("create-wallet", output), COMMAND_FAILURE);

    // the account passphrase comes from the input
    config.SetAccountName("first");
    ASSERT_EQ(Run("create-account", output, "account pass\n"), NORMAL_EXIT);
    EXPECT_NE(output.find("Account passphrase:"), std::string::npos);
    EXPECT_NE(output.find("path   = m/12381/3600/2/0/0"), std::string::npos);

    config.SetAccountName("second");
    ASSERT_EQ(Run("create-account", output, "account pass\n"), NORMAL_EXIT);

    ASSERT_EQ(Run("list-accounts", output), NORMAL_EXIT);
    EXPECT_NE(output.find("first\t"), std::string::npos);
    EXPECT_NE(output.find("second\t"), std::string::npos);

    // a listing cut short by the store is an error, not a shorter list
    store.failReadsAfter = 1;
    EXPECT_EQ(Run("list-accounts", output), COMMAND_FAILURE);
    store.failReadsAfter = -1;

    config.SetAccountName("second");
    ASSERT_EQ(Run("show-account", output), NORMAL_EXIT);
    EXPECT_NE(output.find("m/12381/3600/2/1/0"), std::string::npos);

    config.SetAccountName("m/12381/3600/2/1/0");
    std::string derived;
    ASSERT_EQ(Run("show-account", derived), NORMAL_EXIT);
    auto pubkey = output.substr(output.find("pubkey = "));
    EXPECT_NE(derived.find(pubkey), std::string::npos);

    config.SetAccountName("missing");
    EXPECT_EQ(Run("show-account", output), COMMAND_FAILURE);
}

TEST_F(TestCommands, command_failures) {
    std::string output;
    EXPECT_EQ(Run("unknown", output), COMMANDLINE_INIT_FAILURE);

    config.SetPassphrase(fac.CreatePassphrase("pass"));
    EXPECT_EQ(Run("create-wallet", output), COMMAND_FAILURE);
    EXPECT_EQ(store.GetWalletCount(), 0);

    config.SetWalletName("bad seed");
    config.SetSeedHex("xyz");
    EXPECT_EQ(Run("create-wallet", output), COMMAND_FAILURE);
    config.SetSeedHex("00ff");
    EXPECT_EQ(Run("create-wallet", output), COMMAND_FAILURE);
    EXPECT_EQ(store.GetWalletCount(), 0);

    EXPECT_EQ(Run("list-accounts", output), COMMAND_FAILURE);

    config.SetSeedHex("");
    config.SetWalletName("w");
    ASSERT_EQ(Run("create-wallet", output), NORMAL_EXIT);

    config.SetAccountName("a");
    config.SetPassphrase(fac.CreatePassphrase("wrong"));
    EXPECT_EQ(Run("create-account", output, "account\n"), COMMAND_FAILURE);
    EXPECT_EQ(store.GetAccountCount(HDWallet::OpenWallet("w", store, fac.GetEncryptor())->ID()), 0);

    EXPECT_EQ(Run("export", output), COMMAND_FAILURE);
    config.SetFilePath(dir + "missing.bin");
    EXPECT_EQ(Run("import", output, "x\n"), COMMAND_FAILURE);
}

TEST_F(TestCommands, export_and_import) {
    std::string output;
    config.SetWalletName("moving");
    config.SetPassphrase(fac.CreatePassphrase("pass"));
    config.SetAccountPassphrase(fac.CreatePassphrase("account"));
    ASSERT_EQ(Run("create-wallet", output), NORMAL_EXIT);
    config.SetAccountName("one");
    ASSERT_EQ(Run("create-account", output), NORMAL_EXIT);

    config.SetFilePath(dir + "bundle.bin");
    ASSERT_EQ(Run("export", output, "bundle pass\n"), NORMAL_EXIT);
    EXPECT_TRUE(CheckFileExist(dir + "bundle.bin"));

    TestStore other;
    EXPECT_EQ(Run(other, "import", output, "wrong pass\n"), COMMAND_FAILURE);
    EXPECT_EQ(other.Writes(), 0);

    ASSERT_EQ(Run(other, "import", output, "bundle pass\n"), NORMAL_EXIT);
    EXPECT_NE(output.find("imported wallet moving"), std::string::npos);

    auto imported = HDWallet::OpenWallet("moving", other, fac.GetEncryptor());
    auto original = HDWallet::OpenWallet("moving", store, fac.GetEncryptor());
    EXPECT_EQ(imported->GetIndex(), original->GetIndex());
    EXPECT_EQ(imported->AccountByName("one")->PublicKey(), original->AccountByName("one")->PublicKey());

    // a second import of the same bundle collides
    EXPECT_EQ(Run(other, "import", output, "bundle pass\n"), COMMAND_FAILURE);
}
