// Copyright (c) 2019 EPI-ONE Core Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "rocksdb.h"
#include "file_utils.h"
#include "spdlog/spdlog.h"

#include <stdexcept>

using namespace rocksdb;

RocksDB::RocksDB(std::string dbPath, const std::vector<std::string>& columnNames) : db_(nullptr) {
    dbpath_ = std::move(dbPath);
    // Make directory DBPATH if missing
    if (!CheckDirExist(dbpath_)) {
        spdlog::trace("[Store] Creating a new database at {}...", dbpath_);
        if (!MkdirRecursive(dbpath_)) {
            throw std::runtime_error("fail to create the path " + dbpath_);
        }
    } else {
        spdlog::trace("[Store] Loading an old database from {}...", dbpath_);
    }

    // Create column families
    std::vector<ColumnFamilyDescriptor> descriptors;
    for (const std::string& columnName : columnNames) {
        ColumnFamilyOptions cOptions;
        if (columnName == kDefaultColumnFamilyName) {
            cOptions.OptimizeForPointLookup(16L);
        }

        descriptors.push_back(ColumnFamilyDescriptor(columnName, cOptions));
    }

    // Set options
    DBOptions dbOptions;
    dbOptions.db_log_dir                     = dbpath_ + "/log";
    dbOptions.create_if_missing              = true;
    dbOptions.create_missing_column_families = true;
    dbOptions.IncreaseParallelism(2);

    std::vector<ColumnFamilyHandle*> handles;

    // Open DB
    Status status = DB::Open(dbOptions, dbpath_, descriptors, &handles, &db_);
    if (!status.ok()) {
        throw std::runtime_error("DB initialization failed: " + status.ToString());
    }
    // Store handles into a map
    InitHandleMap(handles, columnNames);
    spdlog::trace("[Store] Rocksdb is successfully initialized");
}

void RocksDB::InitHandleMap(const std::vector<ColumnFamilyHandle*>& handles,
                            const std::vector<std::string>& columnNames) {
    handleMap_.reserve(columnNames.size());
    auto keyIter = columnNames.begin();
    auto valIter = handles.begin();
    while (keyIter != columnNames.end() && valIter != handles.end()) {
        handleMap_[*keyIter] = *valIter;
        ++keyIter;
        ++valIter;
    }
}

RocksDB::~RocksDB() {
    // delete column family handles before the db
    for (auto& entry : handleMap_) {
        db_->DestroyColumnFamilyHandle(entry.second);
    }
    handleMap_.clear();

    delete db_;
    spdlog::trace("[Store] Destructing rocksdb");
}

std::optional<std::string> RocksDB::Get(const std::string& column, const Slice& keySlice) const {
    PinnableSlice valueSlice;
    Status s = db_->Get(ReadOptions(), handleMap_.at(column), keySlice, &valueSlice);
    if (!s.ok()) {
        if (!s.IsNotFound()) {
            spdlog::error("[Store] Failed to read column {}: {}", column, s.ToString());
        }
        return {};
    }
    return valueSlice.ToString();
}

bool RocksDB::Put(const std::string& column, const Slice& key, const Slice& value) const {
    Status s = db_->Put(WriteOptions(), handleMap_.at(column), key, value);
    if (!s.ok()) {
        spdlog::error("[Store] Failed to write column {}: {}", column, s.ToString());
        return false;
    }
    return true;
}

bool RocksDB::Delete(const std::string& column, const Slice& key) const {
    return db_->Delete(WriteOptions(), handleMap_.at(column), key).ok();
}

bool RocksDB::Write(WriteBatch& batch) const {
    Status s = db_->Write(WriteOptions(), &batch);
    if (!s.ok()) {
        spdlog::error("[Store] Failed to write batch: {}", s.ToString());
        return false;
    }
    return true;
}
