// Copyright (c) 2019 EPI-ONE Core Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef HDVAULT_KEYPATH_H
#define HDVAULT_KEYPATH_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

static const uint32_t HARDENED_BIT = 0x80000000U;

// purpose and coin type of the account derivation scheme
static const uint32_t KEYPATH_PURPOSE   = 12381;
static const uint32_t KEYPATH_COIN_TYPE = 3600;

/**
 * Parses "m/a/b'/c" style paths. Hardened elements are marked by
 * a trailing ' or h. "m" alone is the empty path.
 */
std::optional<std::vector<uint32_t>> ParseKeypath(const std::string& path);

std::string FormatKeypath(const std::vector<uint32_t>& path, bool hardenedSuffix = false);
std::string WriteKeypath(const std::vector<uint32_t>& path, bool hardenedSuffix = false);

/** m/12381/3600/<walletIndex>/<account>/0 */
std::string AccountKeypath(uint32_t walletIndex, uint32_t account);

#endif // HDVAULT_KEYPATH_H
