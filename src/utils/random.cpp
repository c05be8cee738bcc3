// Copyright (c) 2019 EPI-ONE Core Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "random.h"

#include <climits>
#include <openssl/rand.h>

bool GetOpenSSLRand(unsigned char* buf, size_t size) noexcept {
    if (size > INT_MAX) {
        return false;
    }
    return RAND_bytes(buf, static_cast<int>(size)) == 1;
}

bool GetSecureRand(SecureByte& out, size_t size) {
    out.resize(size);
    if (!GetOpenSSLRand(out.data(), out.size())) {
        memory_cleanse(out.data(), out.size());
        out.clear();
        return false;
    }
    return true;
}
