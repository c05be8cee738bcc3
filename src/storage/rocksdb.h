// Copyright (c) 2019 EPI-ONE Core Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef HDVAULT_ROCKSDB_H
#define HDVAULT_ROCKSDB_H

#include <optional>
#include <rocksdb/db.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <string>
#include <unordered_map>
#include <vector>

/**
 * Owner of a RocksDB instance opened with a fixed set of column
 * families. Subclasses address columns by name.
 */
class RocksDB {
public:
    RocksDB()               = delete;
    RocksDB(const RocksDB&) = delete;
    RocksDB& operator=(const RocksDB&) = delete;

    virtual ~RocksDB();

    const std::string& GetPath() const {
        return dbpath_;
    }

protected:
    std::unordered_map<std::string, rocksdb::ColumnFamilyHandle*> handleMap_;
    rocksdb::DB* db_;
    std::string dbpath_;

    // throws std::runtime_error if the database cannot be opened
    RocksDB(std::string dbPath, const std::vector<std::string>& columnNames);
    void InitHandleMap(const std::vector<rocksdb::ColumnFamilyHandle*>& handles,
                       const std::vector<std::string>& columnNames);

    std::optional<std::string> Get(const std::string& column, const rocksdb::Slice& key) const;
    bool Put(const std::string& column, const rocksdb::Slice& key, const rocksdb::Slice& value) const;
    bool Delete(const std::string& column, const rocksdb::Slice& key) const;
    bool Write(rocksdb::WriteBatch& batch) const;
};

#endif // HDVAULT_ROCKSDB_H
