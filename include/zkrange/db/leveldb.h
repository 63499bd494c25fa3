// ZKRANGE - LevelDB Wrapper
// Copyright (c) 2024 ZKRANGE Developers
// MIT License
//
// This file provides the LevelDB and in-memory implementations of the
// database interface.

#ifndef ZKRANGE_DB_LEVELDB_H
#define ZKRANGE_DB_LEVELDB_H

#include "zkrange/db/database.h"
#include <map>
#include <mutex>

#ifdef ZKRANGE_USE_LEVELDB
#include <leveldb/db.h>
#include <leveldb/write_batch.h>
#include <leveldb/cache.h>
#include <leveldb/filter_policy.h>
#endif

namespace zkrange {
namespace db {

#ifdef ZKRANGE_USE_LEVELDB

// ============================================================================
// LevelDB Iterator Wrapper
// ============================================================================

class LevelDBIterator : public Iterator {
private:
    std::unique_ptr<leveldb::Iterator> iter_;

public:
    explicit LevelDBIterator(leveldb::Iterator* iter) : iter_(iter) {}

    bool Valid() const override { return iter_->Valid(); }

    void SeekToFirst() override { iter_->SeekToFirst(); }
    void Seek(const Slice& target) override {
        iter_->Seek(leveldb::Slice(target.data(), target.size()));
    }

    void Next() override { iter_->Next(); }

    Slice key() const override {
        leveldb::Slice k = iter_->key();
        return Slice(k.data(), k.size());
    }

    Slice value() const override {
        leveldb::Slice v = iter_->value();
        return Slice(v.data(), v.size());
    }

    Status status() const override {
        leveldb::Status s = iter_->status();
        if (s.ok()) return Status::Ok();
        if (s.IsNotFound()) return Status::NotFound(s.ToString());
        if (s.IsCorruption()) return Status::Corruption(s.ToString());
        return Status::IOError(s.ToString());
    }
};

// ============================================================================
// LevelDB Database Implementation
// ============================================================================

class LevelDBDatabase : public Database {
private:
    std::unique_ptr<leveldb::DB> db_;
    std::unique_ptr<leveldb::Cache> cache_;
    std::unique_ptr<const leveldb::FilterPolicy> filter_policy_;

    static Status ConvertStatus(const leveldb::Status& s) {
        if (s.ok()) return Status::Ok();
        if (s.IsNotFound()) return Status::NotFound(s.ToString());
        if (s.IsCorruption()) return Status::Corruption(s.ToString());
        if (s.IsIOError()) return Status::IOError(s.ToString());
        if (s.IsNotSupportedError()) return Status::NotSupported(s.ToString());
        if (s.IsInvalidArgument()) return Status::InvalidArgument(s.ToString());
        return Status::IOError(s.ToString());
    }

    static leveldb::ReadOptions MakeReadOptions(const ReadOptions& opts) {
        leveldb::ReadOptions lo;
        lo.verify_checksums = opts.verify_checksums;
        lo.fill_cache = opts.fill_cache;
        return lo;
    }

    static leveldb::WriteOptions MakeWriteOptions(const WriteOptions& opts) {
        leveldb::WriteOptions lo;
        lo.sync = opts.sync;
        return lo;
    }

public:
    LevelDBDatabase(leveldb::DB* db, leveldb::Cache* cache,
                    const leveldb::FilterPolicy* filter)
        : db_(db), cache_(cache), filter_policy_(filter) {}

    ~LevelDBDatabase() override {
        // DB must close before its cache and filter policy
        db_.reset();
        cache_.reset();
        filter_policy_.reset();
    }

    using Database::Get;
    using Database::Put;
    using Database::Delete;
    using Database::Write;
    using Database::NewIterator;

    Status Get(const ReadOptions& options, const Slice& key, std::string* value) override {
        leveldb::Slice lkey(key.data(), key.size());
        return ConvertStatus(db_->Get(MakeReadOptions(options), lkey, value));
    }

    Status Put(const WriteOptions& options, const Slice& key, const Slice& value) override {
        leveldb::Slice lkey(key.data(), key.size());
        leveldb::Slice lval(value.data(), value.size());
        return ConvertStatus(db_->Put(MakeWriteOptions(options), lkey, lval));
    }

    Status Delete(const WriteOptions& options, const Slice& key) override {
        leveldb::Slice lkey(key.data(), key.size());
        return ConvertStatus(db_->Delete(MakeWriteOptions(options), lkey));
    }

    Status Write(const WriteOptions& options, WriteBatch* batch) override {
        leveldb::WriteBatch lb;
        batch->Iterate([&lb](const std::string& key, const std::optional<std::string>& value) {
            if (value) {
                lb.Put(key, *value);
            } else {
                lb.Delete(key);
            }
        });
        return ConvertStatus(db_->Write(MakeWriteOptions(options), &lb));
    }

    std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) override {
        return std::make_unique<LevelDBIterator>(db_->NewIterator(MakeReadOptions(options)));
    }
};

#endif // ZKRANGE_USE_LEVELDB

// ============================================================================
// In-Memory Database
// ============================================================================

/**
 * In-memory database for tests and for the non-persistent ledger mode.
 * Contents are lost when the object is destroyed.
 */
class MemoryDatabase : public Database {
private:
    std::map<std::string, std::string> data_;
    mutable std::mutex mutex_;

public:
    MemoryDatabase() = default;

    using Database::Get;
    using Database::Put;
    using Database::Delete;
    using Database::Write;
    using Database::NewIterator;

    Status Get(const ReadOptions& options, const Slice& key, std::string* value) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = data_.find(key.ToString());
        if (it == data_.end()) {
            return Status::NotFound();
        }
        *value = it->second;
        return Status::Ok();
    }

    Status Put(const WriteOptions& options, const Slice& key, const Slice& value) override {
        std::lock_guard<std::mutex> lock(mutex_);
        data_[key.ToString()] = value.ToString();
        return Status::Ok();
    }

    Status Delete(const WriteOptions& options, const Slice& key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        data_.erase(key.ToString());
        return Status::Ok();
    }

    Status Write(const WriteOptions& options, WriteBatch* batch) override {
        std::lock_guard<std::mutex> lock(mutex_);
        batch->Iterate([this](const std::string& key, const std::optional<std::string>& value) {
            if (value) {
                data_[key] = *value;
            } else {
                data_.erase(key);
            }
        });
        return Status::Ok();
    }

    /// Iterates a snapshot of the contents taken at creation
    std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) override;

    size_t Size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return data_.size();
    }

    void Clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        data_.clear();
    }
};

/**
 * Iterator for MemoryDatabase. Owns a copy of the map.
 */
class MemoryIterator : public Iterator {
private:
    std::map<std::string, std::string> data_;
    std::map<std::string, std::string>::const_iterator iter_;

public:
    explicit MemoryIterator(std::map<std::string, std::string> data)
        : data_(std::move(data)), iter_(data_.end()) {}

    bool Valid() const override { return iter_ != data_.end(); }

    void SeekToFirst() override { iter_ = data_.begin(); }

    void Seek(const Slice& target) override {
        iter_ = data_.lower_bound(target.ToString());
    }

    void Next() override {
        if (iter_ != data_.end()) {
            ++iter_;
        }
    }

    Slice key() const override {
        return Slice(iter_->first);
    }

    Slice value() const override {
        return Slice(iter_->second);
    }

    Status status() const override {
        return Status::Ok();
    }
};

inline std::unique_ptr<Iterator> MemoryDatabase::NewIterator(const ReadOptions& options) {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::make_unique<MemoryIterator>(data_);
}

} // namespace db
} // namespace zkrange

#endif // ZKRANGE_DB_LEVELDB_H
