// Copyright (c) 2019 EPI-ONE Core Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef HDVAULT_UUID_H
#define HDVAULT_UUID_H

#include <array>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

/**
 * 128-bit identifier of wallets and accounts, printed in the canonical
 * 8-4-4-4-12 lowercase form
 */
class UUID {
public:
    static const size_t SIZE = 16;

    UUID() : data_{} {}
    explicit UUID(const std::array<unsigned char, SIZE>& data) : data_(data) {}

    /** Version 4 identifier from the OpenSSL generator */
    static UUID Random();

    static std::optional<UUID> FromString(const std::string& str);
    static std::optional<UUID> FromBytes(const std::string& bytes);

    std::string ToString() const;

    /** Raw 16 bytes, used as a storage key */
    std::string ToBytes() const;

    bool IsNull() const;

    const std::array<unsigned char, SIZE>& Data() const {
        return data_;
    }

    bool operator==(const UUID& other) const {
        return data_ == other.data_;
    }

    bool operator!=(const UUID& other) const {
        return data_ != other.data_;
    }

    bool operator<(const UUID& other) const {
        return data_ < other.data_;
    }

private:
    std::array<unsigned char, SIZE> data_;
};

namespace std {
template <>
struct hash<UUID> {
    size_t operator()(const UUID& id) const {
        size_t h = 0;
        for (unsigned char c : id.Data()) {
            h = h * 131 + c;
        }
        return h;
    }
};
} // namespace std

#endif // HDVAULT_UUID_H
