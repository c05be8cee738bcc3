// Copyright (c) 2019 EPI-ONE Core Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef HDVAULT_STRENCODINGS_H
#define HDVAULT_STRENCODINGS_H

#include <optional>
#include <string>
#include <vector>

std::string HexStr(const unsigned char* begin, size_t len);

template <typename T>
std::string HexStr(const T& vch) {
    return HexStr(reinterpret_cast<const unsigned char*>(vch.data()), vch.size());
}

/** Lowercase or uppercase hex with an even number of digits, no prefix */
bool IsHex(const std::string& str);

std::optional<std::vector<unsigned char>> ParseHex(const std::string& str);

/** Rejects overlong forms, surrogates and code points above U+10FFFF */
bool IsValidUTF8(const std::string& str);

#endif // HDVAULT_STRENCODINGS_H
