// Copyright (c) 2019 EPI-ONE Core Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "strencodings.h"

#include <cstdint>

namespace {
const char kHexDigits[] = "0123456789abcdef";

int HexDigit(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}
} // namespace

std::string HexStr(const unsigned char* begin, size_t len) {
    std::string rv;
    rv.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        rv.push_back(kHexDigits[begin[i] >> 4]);
        rv.push_back(kHexDigits[begin[i] & 15]);
    }
    return rv;
}

bool IsHex(const std::string& str) {
    if (str.empty() || str.size() % 2 != 0) {
        return false;
    }
    for (char c : str) {
        if (HexDigit(c) < 0) {
            return false;
        }
    }
    return true;
}

std::optional<std::vector<unsigned char>> ParseHex(const std::string& str) {
    if (str.size() % 2 != 0) {
        return {};
    }

    std::vector<unsigned char> vch;
    vch.reserve(str.size() / 2);
    for (size_t i = 0; i < str.size(); i += 2) {
        int hi = HexDigit(str[i]);
        int lo = HexDigit(str[i + 1]);
        if (hi < 0 || lo < 0) {
            return {};
        }
        vch.push_back(static_cast<unsigned char>((hi << 4) | lo));
    }
    return vch;
}

bool IsValidUTF8(const std::string& str) {
    size_t i = 0;
    while (i < str.size()) {
        auto c = static_cast<unsigned char>(str[i]);
        size_t len;
        uint32_t cp;
        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            len = 2;
            cp  = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3;
            cp  = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4;
            cp  = c & 0x07;
        } else {
            return false;
        }

        if (i + len > str.size()) {
            return false;
        }
        for (size_t j = 1; j < len; ++j) {
            auto cc = static_cast<unsigned char>(str[i + j]);
            if ((cc & 0xC0) != 0x80) {
                return false;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }

        static const uint32_t minimum[] = {0, 0, 0x80, 0x800, 0x10000};
        if (cp < minimum[len] || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            return false;
        }
        i += len;
    }
    return true;
}
