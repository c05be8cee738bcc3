// Copyright (c) 2019 EPI-ONE Core Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef HDVAULT_INIT_H
#define HDVAULT_INIT_H

#include "config.h"
#include "cpptoml.h"
#include "cxxopts.hpp"
#include "file_utils.h"
#include "spdlog/sinks/basic_file_sink.h"
#include "wallet_store.h"

extern std::unique_ptr<WalletStore> STORE;

enum : uint8_t {
    NORMAL_EXIT = 0,
    COMMANDLINE_INIT_FAILURE,
    LOG_INIT_FAILURE,
    STORE_INIT_FAILURE,
    COMMAND_FAILURE,
};

int Init(int argc, char* argv[]);
void ShutDown();

void LoadConfigFile();

void SetupCommandline(cxxopts::Options& options);
void ParseCommandLine(int argc, char* argv[], cxxopts::Options& options);

void UseFileLogger(const std::string& path, const std::string& filename);
void InitLogger();

#endif // HDVAULT_INIT_H
