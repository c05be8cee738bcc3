// Copyright (c) 2019 EPI-ONE Core Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "init.h"
#include "rocksdb_store.h"

#include <iostream>

std::unique_ptr<Config> CONFIG;
std::unique_ptr<WalletStore> STORE;

void CreateRoot(const std::string& path) {
    if (!CheckDirExist(path)) {
        if (MkdirRecursive(path)) {
            spdlog::info("root {} has been created", path);
        } else {
            throw spdlog::spdlog_ex("fail to create the path " + path);
        }
    }
}

int Init(int argc, char* argv[]) {
    /*
     *  Create config instance
     */
    CONFIG = std::make_unique<Config>();

    /*
     *  Setup and parse the command line
     */
    cxxopts::Options options("hdvault", "hierarchical deterministic wallet keeper");
    options.positional_help("<command>");

    try {
        SetupCommandline(options);
        ParseCommandLine(argc, argv, options);
    } catch (const std::exception& e) {
        std::cout << options.help() << std::endl;
        std::cerr << "error parsing options: " << e.what() << std::endl;
        return COMMANDLINE_INIT_FAILURE;
    }

    /*
     *  Load config file
     */
    try {
        LoadConfigFile();
    } catch (const cpptoml::parse_exception& e) {
        std::cerr << "error parsing " << CONFIG->GetConfigFilePath() << ": " << e.what() << std::endl;
        return COMMANDLINE_INIT_FAILURE;
    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << e.what() << std::endl;
        return COMMANDLINE_INIT_FAILURE;
    }

    /*
     * Init logger
     */
    InitLogger();

    CONFIG->ShowConfig();

    /*
     * Open the store
     */
    try {
        STORE = std::make_unique<RocksDBStore>(CONFIG->GetDBPath());
    } catch (const std::runtime_error& e) {
        spdlog::error("fail to open the store at {}: {}", CONFIG->GetDBPath(), e.what());
        return STORE_INIT_FAILURE;
    }

    return NORMAL_EXIT;
}

void SetupCommandline(cxxopts::Options& options) {
    // clang-format off
    options.add_options()
    ("h,help", "print this message", cxxopts::value<bool>())
    ("configpath", "specified config path", cxxopts::value<std::string>()->default_value("config.toml"))
    ("w,wallet", "wallet name", cxxopts::value<std::string>())
    ("p,passphrase", "wallet passphrase", cxxopts::value<std::string>())
    ("a,account", "account name", cxxopts::value<std::string>())
    ("account-passphrase", "account passphrase", cxxopts::value<std::string>())
    ("seed", "hex encoded 32 byte seed for create-wallet", cxxopts::value<std::string>())
    ("wallet-index", "wallet index for create-wallet", cxxopts::value<uint32_t>())
    ("f,file", "bundle file for export and import", cxxopts::value<std::string>())
    ("export-passphrase", "passphrase of the export bundle", cxxopts::value<std::string>())
    ("command", "create-wallet | create-account | list-accounts | show-account | export | import",
     cxxopts::value<std::string>())
    ;
    // clang-format on
    options.parse_positional({"command"});
}

void ParseCommandLine(int argc, char** argv, cxxopts::Options& options) {
    auto result = options.parse(argc, argv);
    if (result["help"].as<bool>()) {
        std::cout << options.help() << std::endl;
        exit(0);
    }
    // configpath has a default value, there is no need to
    // call result.count() to detect if it has a value
    CONFIG->SetConfigFilePath(result["configpath"].as<std::string>());

    if (result.count("command") > 0) {
        CONFIG->SetCommand(result["command"].as<std::string>());
    }
    if (result.count("wallet") > 0) {
        CONFIG->SetWalletName(result["wallet"].as<std::string>());
    }
    if (result.count("passphrase") > 0) {
        auto passphrase = result["passphrase"].as<std::string>();
        CONFIG->SetPassphrase(SecureString(passphrase.begin(), passphrase.end()));
    }
    if (result.count("account") > 0) {
        CONFIG->SetAccountName(result["account"].as<std::string>());
    }
    if (result.count("account-passphrase") > 0) {
        auto passphrase = result["account-passphrase"].as<std::string>();
        CONFIG->SetAccountPassphrase(SecureString(passphrase.begin(), passphrase.end()));
    }
    if (result.count("seed") > 0) {
        CONFIG->SetSeedHex(result["seed"].as<std::string>());
    }
    if (result.count("wallet-index") > 0) {
        CONFIG->SetWalletIndex(result["wallet-index"].as<uint32_t>());
    }
    if (result.count("file") > 0) {
        CONFIG->SetFilePath(result["file"].as<std::string>());
    }
    if (result.count("export-passphrase") > 0) {
        auto passphrase = result["export-passphrase"].as<std::string>();
        CONFIG->SetExportPassphrase(SecureString(passphrase.begin(), passphrase.end()));
    }
}

void LoadConfigFile() {
    std::string config_path = CONFIG->GetConfigFilePath();
    if (!CheckFileExist(config_path)) {
        std::cerr << config_path << " not found, will use the default config" << std::endl;
        CreateRoot(CONFIG->GetRoot());
        return;
    }

    auto configContent = cpptoml::parse_file(config_path);

    auto global_config = configContent->get_table("global");
    if (global_config) {
        auto root = global_config->get_as<std::string>("root");
        if (root) {
            CONFIG->SetRoot(*root);
        }
    }

    CreateRoot(CONFIG->GetRoot());

    // logger
    auto log_config = configContent->get_table("logs");
    if (log_config) {
        auto use_file_logger = log_config->get_as<bool>("use_file_logger").value_or(false);
        CONFIG->SetUseFileLogger(use_file_logger);
        if (use_file_logger) {
            auto path     = log_config->get_as<std::string>("path").value_or("logs/");
            auto filename = log_config->get_as<std::string>("filename").value_or("hdvault.log");

            if (path.empty() || path[path.length() - 1] != '/') {
                path.append("/");
            }

            CONFIG->SetLoggerFilename(filename);
            CONFIG->SetLoggerPath(path);
        }

        auto level = log_config->get_as<std::string>("level");
        if (level) {
            CONFIG->SetLoggerLevel(*level);
        }
    }

    // store
    auto store_config = configContent->get_table("store");
    if (store_config) {
        auto db_path = store_config->get_as<std::string>("path");
        if (db_path) {
            CONFIG->SetDBPath(*db_path);
        }
    }

    // crypto
    auto crypto_config = configContent->get_table("crypto");
    if (crypto_config) {
        auto kdf_rounds = crypto_config->get_as<uint32_t>("kdf_rounds");
        if (kdf_rounds) {
            CONFIG->SetKdfRounds(*kdf_rounds);
        }

        auto export_rounds = crypto_config->get_as<uint32_t>("export_rounds");
        if (export_rounds) {
            CONFIG->SetExportRounds(*export_rounds);
        }
    }

    // wallet
    auto wallet_config = configContent->get_table("wallet");
    if (wallet_config) {
        auto capacity = wallet_config->get_as<uint32_t>("stream_capacity");
        if (capacity) {
            CONFIG->SetStreamCapacity(*capacity);
        }
    }
}

void InitLogger() {
    if (CONFIG->IsUseFileLogger()) {
        UseFileLogger(CONFIG->GetLoggerPath(), CONFIG->GetLoggerFilename());
    }
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e][%t][%l] %v");
    spdlog::set_level(spdlog::level::from_str(CONFIG->GetLoggerLevel()));
    spdlog::flush_on(spdlog::level::warn);
}

void UseFileLogger(const std::string& path, const std::string& filename) {
    try {
        if (!CheckDirExist(path)) {
            std::cerr << "The logger dir \"" << path << "\" not found, try to create the directory..." << std::endl;
            if (MkdirRecursive(path)) {
                std::cerr << path << " has been created" << std::endl;
            } else {
                throw spdlog::spdlog_ex("fail to create the logger file");
            }
        }

        auto file_logger = spdlog::basic_logger_mt("basic_logger", path + filename);
        spdlog::set_default_logger(file_logger);
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "The file logger init failed: " << ex.what() << std::endl;
        std::cerr << "Please check your config setting" << std::endl;
        exit(LOG_INIT_FAILURE);
    }
}

void ShutDown() {
    spdlog::debug("shutdown start");
    STORE.reset();
    CONFIG.reset();
    spdlog::shutdown();
}
