// ZKRANGE - Database Implementation
// Copyright (c) 2024 ZKRANGE Developers
// MIT License

#include "zkrange/db/database.h"
#include "zkrange/db/leveldb.h"
#include "zkrange/util/logging.h"

namespace zkrange {
namespace db {

// ============================================================================
// Database Factory Functions
// ============================================================================

bool HasPersistentBackend() {
#ifdef ZKRANGE_USE_LEVELDB
    return true;
#else
    return false;
#endif
}

std::pair<Status, std::unique_ptr<Database>> OpenDatabase(
    const std::filesystem::path& path,
    const Options& options)
{
#ifdef ZKRANGE_USE_LEVELDB
    leveldb::Options lo;
    lo.create_if_missing = options.create_if_missing;
    lo.error_if_exists = options.error_if_exists;
    lo.paranoid_checks = options.paranoid_checks;
    lo.write_buffer_size = options.write_buffer_size;
    lo.max_open_files = options.max_open_files;

    leveldb::Cache* cache = nullptr;
    if (options.block_cache_size > 0) {
        cache = leveldb::NewLRUCache(options.block_cache_size);
        lo.block_cache = cache;
    }

    const leveldb::FilterPolicy* filter = nullptr;
    if (options.bloom_filter_bits > 0) {
        filter = leveldb::NewBloomFilterPolicy(options.bloom_filter_bits);
        lo.filter_policy = filter;
    }

    if (options.create_if_missing && !path.parent_path().empty()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            delete cache;
            delete filter;
            return {Status::IOError(ec.message()), nullptr};
        }
    }

    leveldb::DB* db = nullptr;
    leveldb::Status s = leveldb::DB::Open(lo, path.string(), &db);

    if (!s.ok()) {
        delete cache;
        delete filter;

        LOG_ERROR(util::LogCategory::DB) << "Failed to open " << path.string()
                                         << ": " << s.ToString();
        if (s.IsCorruption()) {
            return {Status::Corruption(s.ToString()), nullptr};
        } else if (s.IsInvalidArgument()) {
            return {Status::InvalidArgument(s.ToString()), nullptr};
        }
        return {Status::IOError(s.ToString()), nullptr};
    }

    LOG_DEBUG(util::LogCategory::DB) << "Opened LevelDB at " << path.string();
    return {Status::Ok(), std::make_unique<LevelDBDatabase>(db, cache, filter)};
#else
    (void)options;
    LOG_WARN(util::LogCategory::DB) << "Cannot open " << path.string()
                                    << ": built without LevelDB";
    return {Status::NotSupported("built without LevelDB"), nullptr};
#endif
}

Status DestroyDatabase(const std::filesystem::path& path) {
#ifdef ZKRANGE_USE_LEVELDB
    leveldb::Status s = leveldb::DestroyDB(path.string(), leveldb::Options());
    if (!s.ok()) {
        return Status::IOError(s.ToString());
    }
    return Status::Ok();
#else
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
    if (ec) {
        return Status::IOError(ec.message());
    }
    return Status::Ok();
#endif
}

} // namespace db
} // namespace zkrange
