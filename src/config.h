// Copyright (c) 2019 EPI-ONE Core Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef HDVAULT_CONFIG_H
#define HDVAULT_CONFIG_H

#include "account_stream.h"
#include "bundle_codec.h"
#include "crypter.h"
#include "secure.h"
#include "spdlog/spdlog.h"

#include <algorithm>
#include <memory>
#include <optional>
#include <sstream>
#include <string>

class Config {
public:
    const std::string& GetConfigFilePath() const {
        return configFilePath_;
    }

    void SetConfigFilePath(const std::string& configFilePath) {
        configFilePath_ = configFilePath;
    }

    void SetRoot(const std::string& root) {
        root_ = root;
        if (root_.empty() || root_.back() != '/') {
            root_.append("/");
        }
    }

    const std::string& GetRoot() const {
        return root_;
    }

    const std::string& GetLoggerLevel() const {
        return loggerLevel_;
    }

    void SetLoggerLevel(const std::string& level) {
        loggerLevel_ = level;
    }

    bool IsUseFileLogger() const {
        return useFileLogger_;
    }

    void SetUseFileLogger(bool useFileLogger) {
        useFileLogger_ = useFileLogger;
    }

    const std::string GetLoggerPath() const {
        return GetRoot() + loggerPath_;
    }

    void SetLoggerPath(const std::string& loggerPath) {
        loggerPath_ = loggerPath;
    }

    const std::string& GetLoggerFilename() const {
        return loggerFilename_;
    }

    void SetLoggerFilename(const std::string& loggerFilename) {
        loggerFilename_ = loggerFilename;
    }

    std::string GetDBPath() const {
        return GetRoot() + dbPath_;
    }

    void SetDBPath(const std::string& dbPath) {
        dbPath_ = dbPath;
    }

    uint32_t GetKdfRounds() const {
        return kdfRounds_;
    }

    void SetKdfRounds(uint32_t rounds) {
        kdfRounds_ = std::max<uint32_t>(rounds, 1);
    }

    uint32_t GetExportRounds() const {
        return exportRounds_;
    }

    void SetExportRounds(uint32_t rounds) {
        exportRounds_ = std::max<uint32_t>(rounds, 1);
    }

    size_t GetStreamCapacity() const {
        return streamCapacity_;
    }

    void SetStreamCapacity(size_t capacity) {
        streamCapacity_ = std::max<size_t>(capacity, 1);
    }

    // command line only

    const std::string& GetCommand() const {
        return command_;
    }

    void SetCommand(const std::string& command) {
        command_ = command;
    }

    const std::string& GetWalletName() const {
        return walletName_;
    }

    void SetWalletName(const std::string& name) {
        walletName_ = name;
    }

    const std::string& GetAccountName() const {
        return accountName_;
    }

    void SetAccountName(const std::string& name) {
        accountName_ = name;
    }

    const std::optional<SecureString>& GetPassphrase() const {
        return passphrase_;
    }

    void SetPassphrase(const SecureString& passphrase) {
        passphrase_ = passphrase;
    }

    const std::optional<SecureString>& GetAccountPassphrase() const {
        return accountPassphrase_;
    }

    void SetAccountPassphrase(const SecureString& passphrase) {
        accountPassphrase_ = passphrase;
    }

    const std::optional<SecureString>& GetExportPassphrase() const {
        return exportPassphrase_;
    }

    void SetExportPassphrase(const SecureString& passphrase) {
        exportPassphrase_ = passphrase;
    }

    const std::string& GetSeedHex() const {
        return seedHex_;
    }

    void SetSeedHex(const std::string& seed) {
        seedHex_ = seed;
    }

    uint32_t GetWalletIndex() const {
        return walletIndex_;
    }

    void SetWalletIndex(uint32_t index) {
        walletIndex_ = index;
    }

    const std::string& GetFilePath() const {
        return filePath_;
    }

    void SetFilePath(const std::string& path) {
        filePath_ = path;
    }

    void ShowConfig() const {
        std::stringstream ss;

        ss << std::endl << "current config: " << std::endl;
        ss << "config file path = " << GetConfigFilePath() << std::endl;
        ss << "root = " << GetRoot() << std::endl;
        ss << "logger level = " << loggerLevel_ << std::endl;
        ss << "use logger file = " << useFileLogger_ << std::endl;
        ss << "logger file path = " << GetLoggerPath() << loggerFilename_ << std::endl;
        ss << "dbpath = " << GetDBPath() << std::endl;
        ss << "kdf rounds = " << kdfRounds_ << std::endl;
        ss << "export rounds = " << exportRounds_ << std::endl;
        ss << "stream capacity = " << streamCapacity_ << std::endl;
        spdlog::debug(ss.str());
    }

private:
    // config file
    std::string configFilePath_ = "config.toml";
    std::string root_           = "hdvault/";

    // logger
    std::string loggerLevel_    = "info";
    bool useFileLogger_         = false;
    std::string loggerPath_     = "logs/";
    std::string loggerFilename_ = "hdvault.log";

    // store
    std::string dbPath_ = "db/";

    // crypto
    uint32_t kdfRounds_    = DEFAULT_KDF_ROUNDS;
    uint32_t exportRounds_ = DEFAULT_BUNDLE_ROUNDS;

    // wallet
    size_t streamCapacity_ = DEFAULT_STREAM_CAPACITY;

    // command
    std::string command_;
    std::string walletName_;
    std::string accountName_;
    std::optional<SecureString> passphrase_;
    std::optional<SecureString> accountPassphrase_;
    std::optional<SecureString> exportPassphrase_;
    std::string seedHex_;
    uint32_t walletIndex_ = 0;
    std::string filePath_;
};

extern std::unique_ptr<Config> CONFIG;

#endif // HDVAULT_CONFIG_H
