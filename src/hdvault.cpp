// Copyright (c) 2019 EPI-ONE Core Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "commands.h"
#include "init.h"

#include <iostream>

int main(int argc, char** argv) {
    int init_result = Init(argc, argv);
    if (init_result != NORMAL_EXIT) {
        return init_result;
    }

    int result = Commands(*STORE, *CONFIG, std::cin).Run(std::cout);
    ShutDown();
    return result;
}
