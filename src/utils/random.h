// Copyright (c) 2019 EPI-ONE Core Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef HDVAULT_RANDOM_H
#define HDVAULT_RANDOM_H

#include "secure.h"

#include <cstddef>

bool GetOpenSSLRand(unsigned char* buf, size_t size) noexcept;

/**
 * Fills a secure buffer of the given size with random bytes,
 * returns false if the OpenSSL generator is not seeded
 */
bool GetSecureRand(SecureByte& out, size_t size);

#endif // HDVAULT_RANDOM_H
