// Copyright (c) 2019 EPI-ONE Core Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "uuid.h"
#include "random.h"
#include "strencodings.h"

#include <stdexcept>

UUID UUID::Random() {
    std::array<unsigned char, SIZE> data{};
    if (!GetOpenSSLRand(data.data(), data.size())) {
        throw std::runtime_error("random generator is not seeded");
    }

    // version 4, variant 10
    data[6] = (data[6] & 0x0f) | 0x40;
    data[8] = (data[8] & 0x3f) | 0x80;
    return UUID(data);
}

std::optional<UUID> UUID::FromString(const std::string& str) {
    if (str.size() != 36 || str[8] != '-' || str[13] != '-' || str[18] != '-' || str[23] != '-') {
        return {};
    }

    std::string hex;
    hex.reserve(32);
    for (size_t i = 0; i < str.size(); ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            continue;
        }
        hex.push_back(str[i]);
    }

    auto bytes = ParseHex(hex);
    if (!bytes || bytes->size() != SIZE) {
        return {};
    }

    std::array<unsigned char, SIZE> data{};
    std::copy(bytes->begin(), bytes->end(), data.begin());
    return UUID(data);
}

std::optional<UUID> UUID::FromBytes(const std::string& bytes) {
    if (bytes.size() != SIZE) {
        return {};
    }
    std::array<unsigned char, SIZE> data{};
    std::copy(bytes.begin(), bytes.end(), data.begin());
    return UUID(data);
}

std::string UUID::ToString() const {
    std::string hex = HexStr(data_);
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" + hex.substr(16, 4) + "-" +
           hex.substr(20, 12);
}

std::string UUID::ToBytes() const {
    return std::string(data_.begin(), data_.end());
}

bool UUID::IsNull() const {
    for (unsigned char c : data_) {
        if (c != 0) {
            return false;
        }
    }
    return true;
}
