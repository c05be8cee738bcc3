// Copyright (c) 2019 EPI-ONE Core Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "name_index.h"
#include "records.h"

bool NameIndex::Add(const UUID& id, const std::string& name) {
    if (name.empty() || byName_.count(name) > 0 || byID_.count(id) > 0) {
        return false;
    }
    byName_.emplace(name, id);
    byID_.emplace(id, name);
    return true;
}

bool NameIndex::Remove(const UUID& id) {
    auto it = byID_.find(id);
    if (it == byID_.end()) {
        return false;
    }
    byName_.erase(it->second);
    byID_.erase(it);
    return true;
}

std::optional<UUID> NameIndex::GetID(const std::string& name) const {
    auto it = byName_.find(name);
    if (it == byName_.end()) {
        return {};
    }
    return it->second;
}

std::optional<std::string> NameIndex::GetName(const UUID& id) const {
    auto it = byID_.find(id);
    if (it == byID_.end()) {
        return {};
    }
    return it->second;
}

std::vector<std::pair<std::string, UUID>> NameIndex::GetEntries() const {
    return {byName_.begin(), byName_.end()};
}

std::string NameIndex::Serialize() const {
    records::AccountsIndex msg;
    for (const auto& [name, id] : byName_) {
        auto* entry = msg.add_entries();
        entry->set_id(id.ToBytes());
        entry->set_name(name);
    }

    std::string data;
    msg.SerializeToString(&data);
    return data;
}

std::optional<NameIndex> NameIndex::Deserialize(const std::string& data) {
    records::AccountsIndex msg;
    if (!msg.ParseFromString(data)) {
        return {};
    }

    NameIndex index;
    for (const auto& entry : msg.entries()) {
        auto id = UUID::FromBytes(entry.id());
        if (!id || !index.Add(*id, entry.name())) {
            return {};
        }
    }
    return index;
}
