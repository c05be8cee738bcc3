// Copyright (c) 2019 EPI-ONE Core Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "cleanse.h"

#include <openssl/crypto.h>

void memory_cleanse(void* ptr, std::size_t len) {
    if (ptr == nullptr || len == 0) {
        return;
    }
    // OPENSSL_cleanse is not elided by the optimizer
    OPENSSL_cleanse(ptr, len);
}
