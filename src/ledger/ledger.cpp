// ZKRANGE - Verification Ledger Implementation
// Copyright (c) 2024 ZKRANGE Developers
// MIT License

#include "zkrange/ledger/ledger.h"
#include "zkrange/db/leveldb.h"
#include "zkrange/util/config.h"
#include "zkrange/util/logging.h"

namespace zkrange {
namespace ledger {

namespace {

const char VERIFIED_FLAG[] = "\x01";

std::string VerifiedKey(const ProofIdentity& identity) {
    return db::MakeKey(db::prefix::VERIFIED, db::Slice(identity.data(), identity.size()));
}

std::string LatestKey(const Subject& subject) {
    return db::MakeKey(db::prefix::LATEST, db::Slice(subject.ToString()));
}

} // namespace

const char* RecordResultToString(RecordResult result) {
    switch (result) {
        case RecordResult::Recorded: return "recorded";
        case RecordResult::AlreadyRecorded: return "already-recorded";
        case RecordResult::StoreError: return "store-error";
    }
    return "unknown";
}

// ============================================================================
// DatabaseLedgerStore
// ============================================================================

DatabaseLedgerStore::DatabaseLedgerStore(std::unique_ptr<db::Database> database,
                                         bool syncWrites)
    : db_(std::move(database)) {
    writeOptions_.sync = syncWrites;
}

DatabaseLedgerStore::DatabaseLedgerStore()
    : DatabaseLedgerStore(std::make_unique<db::MemoryDatabase>()) {}

RecordResult DatabaseLedgerStore::Record(const ProofIdentity& identity,
                                         const Subject& subject) {
    const std::string verifiedKey = VerifiedKey(identity);

    std::lock_guard<std::mutex> lock(mutex_);

    std::string existing;
    db::Status s = db_->Get(verifiedKey, &existing);
    if (s.ok()) {
        return RecordResult::AlreadyRecorded;
    }
    if (!s.IsNotFound()) {
        LOG_ERROR(util::LogCategory::LEDGER) << "Lookup of " << identity.ToHex()
                                             << " failed: " << s.ToString();
        return RecordResult::StoreError;
    }

    db::WriteBatch batch;
    batch.Put(verifiedKey, db::Slice(VERIFIED_FLAG, 1));
    batch.Put(LatestKey(subject), db::Slice(identity.data(), identity.size()));

    s = db_->Write(writeOptions_, &batch);
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::LEDGER) << "Record of " << identity.ToHex()
                                             << " failed: " << s.ToString();
        return RecordResult::StoreError;
    }

    LOG_DEBUG(util::LogCategory::LEDGER) << "Recorded " << identity.ToHex()
                                         << " for " << subject.ToString();
    return RecordResult::Recorded;
}

bool DatabaseLedgerStore::IsRecorded(const ProofIdentity& identity) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return db_->Exists(VerifiedKey(identity));
}

std::optional<ProofIdentity> DatabaseLedgerStore::GetLatest(const Subject& subject) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string value;
    db::Status s = db_->Get(LatestKey(subject), &value);
    if (!s.ok()) {
        if (!s.IsNotFound()) {
            LOG_WARN(util::LogCategory::LEDGER) << "Latest lookup for " << subject.ToString()
                                                << " failed: " << s.ToString();
        }
        return std::nullopt;
    }
    if (value.size() != ProofIdentity::SIZE) {
        LOG_WARN(util::LogCategory::LEDGER) << "Corrupt latest entry for " << subject.ToString();
        return std::nullopt;
    }
    return ProofIdentity(reinterpret_cast<const Byte*>(value.data()), value.size());
}

size_t DatabaseLedgerStore::CountRecorded() const {
    std::lock_guard<std::mutex> lock(mutex_);

    const std::string start = db::MakeKey(db::prefix::VERIFIED);
    size_t count = 0;
    auto it = db_->NewIterator();
    for (it->Seek(start); it->Valid() && it->key().starts_with(start); it->Next()) {
        ++count;
    }
    return count;
}

// ============================================================================
// Factory
// ============================================================================

std::optional<LedgerBackend> ParseLedgerBackend(const std::string& name) {
    if (name == "memory") return LedgerBackend::Memory;
    if (name == "leveldb") return LedgerBackend::LevelDB;
    return std::nullopt;
}

std::optional<LedgerOptions> LoadLedgerOptions(const util::ConfigManager& config,
                                               std::string* error) {
    LedgerOptions options;
    options.backend = db::HasPersistentBackend() ? LedgerBackend::LevelDB : LedgerBackend::Memory;

    if (auto name = config.TryGetString(util::ConfigKeys::LEDGER)) {
        auto backend = ParseLedgerBackend(*name);
        if (!backend) {
            if (error) {
                *error = "ledger must be 'memory' or 'leveldb', got '" + *name + "'";
            }
            return std::nullopt;
        }
        options.backend = *backend;
    }

    std::string dataDir = config.GetPath(util::ConfigKeys::DATADIR, config.GetDataDir());
    options.path = config.GetPath(util::ConfigKeys::LEDGERDIR, dataDir + "/ledger");

    if (config.HasKey(util::ConfigKeys::SYNCWRITES)) {
        auto sync = config.TryGetBool(util::ConfigKeys::SYNCWRITES);
        if (!sync) {
            if (error) {
                *error = "syncwrites must be a boolean";
            }
            return std::nullopt;
        }
        options.syncWrites = *sync;
    }

    return options;
}

std::pair<db::Status, std::unique_ptr<DatabaseLedgerStore>> OpenLedgerStore(
    const LedgerOptions& options) {
    if (options.backend == LedgerBackend::Memory) {
        LOG_INFO(util::LogCategory::LEDGER) << "Using in-memory ledger";
        return {db::Status::Ok(), std::make_unique<DatabaseLedgerStore>()};
    }

    if (options.path.empty()) {
        return {db::Status::InvalidArgument("ledger path is empty"), nullptr};
    }

    auto [status, database] = db::OpenDatabase(options.path);
    if (!status.ok()) {
        return {status, nullptr};
    }

    LOG_INFO(util::LogCategory::LEDGER) << "Opened ledger at " << options.path.string();
    return {db::Status::Ok(),
            std::make_unique<DatabaseLedgerStore>(std::move(database), options.syncWrites)};
}

} // namespace ledger
} // namespace zkrange
