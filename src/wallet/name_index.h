// Copyright (c) 2019 EPI-ONE Core Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef HDVAULT_NAME_INDEX_H
#define HDVAULT_NAME_INDEX_H

#include "uuid.h"

#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

/**
 * Bidirectional map between account names and account ids of one
 * wallet. Names and ids are both unique. Not thread safe, the owning
 * wallet serializes access.
 */
class NameIndex {
public:
    /** Returns false and leaves the index untouched if the name or the id is already present */
    bool Add(const UUID& id, const std::string& name);
    bool Remove(const UUID& id);

    std::optional<UUID> GetID(const std::string& name) const;
    std::optional<std::string> GetName(const UUID& id) const;

    bool Contains(const std::string& name) const {
        return byName_.count(name) > 0;
    }

    size_t Size() const {
        return byName_.size();
    }

    bool Empty() const {
        return byName_.empty();
    }

    void Clear() {
        byName_.clear();
        byID_.clear();
    }

    // sorted by name
    std::vector<std::pair<std::string, UUID>> GetEntries() const;

    /** Protobuf binary encoding, entries in name order */
    std::string Serialize() const;

    /** Empty optional for undecodable data or data breaking uniqueness */
    static std::optional<NameIndex> Deserialize(const std::string& data);

    bool operator==(const NameIndex& other) const {
        return byName_ == other.byName_;
    }

    bool operator!=(const NameIndex& other) const {
        return !(*this == other);
    }

private:
    std::map<std::string, UUID> byName_;
    std::unordered_map<UUID, std::string> byID_;
};

#endif // HDVAULT_NAME_INDEX_H
