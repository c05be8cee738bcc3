// Copyright (c) 2019 EPI-ONE Core Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "keypath.h"

namespace {
std::string FormatPathElem(uint32_t elem, bool hardenedSuffix) {
    std::string out = std::to_string(elem & ~HARDENED_BIT);
    if (elem & HARDENED_BIT) {
        out += (hardenedSuffix ? "h" : "'");
    }
    return out;
}

std::optional<uint32_t> ParsePathElem(std::string elem) {
    bool hardened = false;
    if (!elem.empty() && (elem.back() == '\'' || elem.back() == 'h')) {
        hardened = true;
        elem.pop_back();
    }

    // at most ten digits, no sign, no whitespace
    if (elem.empty() || elem.size() > 10) {
        return {};
    }
    uint64_t value = 0;
    for (char c : elem) {
        if (c < '0' || c > '9') {
            return {};
        }
        value = value * 10 + static_cast<uint64_t>(c - '0');
    }
    if (value >= HARDENED_BIT) {
        return {};
    }

    auto index = static_cast<uint32_t>(value);
    return hardened ? (index | HARDENED_BIT) : index;
}
} // namespace

std::optional<std::vector<uint32_t>> ParseKeypath(const std::string& path) {
    if (path.empty() || path[0] != 'm') {
        return {};
    }

    std::vector<uint32_t> keypath;
    if (path.size() == 1) {
        return keypath;
    }
    if (path[1] != '/') {
        return {};
    }

    size_t pos = 2;
    while (true) {
        size_t next = path.find('/', pos);
        auto elem   = ParsePathElem(path.substr(pos, next == std::string::npos ? std::string::npos : next - pos));
        if (!elem) {
            return {};
        }
        keypath.push_back(*elem);
        if (next == std::string::npos) {
            break;
        }
        pos = next + 1;
    }
    return keypath;
}

std::string FormatKeypath(const std::vector<uint32_t>& path, bool hardenedSuffix) {
    std::string out;
    for (size_t i = 0; i < path.size(); ++i) {
        if (i != 0) {
            out += '/';
        }
        out += FormatPathElem(path[i], hardenedSuffix);
    }
    return out;
}

std::string WriteKeypath(const std::vector<uint32_t>& path, bool hardenedSuffix) {
    if (path.empty()) {
        return "m";
    }
    return "m/" + FormatKeypath(path, hardenedSuffix);
}

std::string AccountKeypath(uint32_t walletIndex, uint32_t account) {
    return "m/" + std::to_string(KEYPATH_PURPOSE) + "/" + std::to_string(KEYPATH_COIN_TYPE) + "/" +
           std::to_string(walletIndex) + "/" + std::to_string(account) + "/0";
}
