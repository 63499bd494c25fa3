// ZKRANGE - Verification Ledger
// Copyright (c) 2024 ZKRANGE Developers
// MIT License
//
// Persistent record of accepted proofs. Records the set of verified proof
// identities and, per subject, the identity of the latest accepted proof.

#ifndef ZKRANGE_LEDGER_LEDGER_H
#define ZKRANGE_LEDGER_LEDGER_H

#include "zkrange/db/database.h"
#include "zkrange/rangeproof/identity.h"
#include "zkrange/rangeproof/proof.h"

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

namespace zkrange {

namespace util {
class ConfigManager;
}

namespace ledger {

using rangeproof::ProofIdentity;
using rangeproof::Subject;

// ============================================================================
// Ledger Interface
// ============================================================================

/// Outcome of recording an identity
enum class RecordResult {
    Recorded,          ///< Identity inserted and latest mapping updated
    AlreadyRecorded,   ///< Identity was present; nothing changed
    StoreError,        ///< Backing store failed; nothing changed
};

const char* RecordResultToString(RecordResult result);

/**
 * Store of verified proof identities.
 *
 * Record must be atomic: the membership check, the insert, and the latest
 * update for the subject happen as one step, so that of two concurrent
 * Record calls for the same identity exactly one returns Recorded.
 */
class ILedgerStore {
public:
    virtual ~ILedgerStore() = default;

    /// Insert identity and set it as the subject's latest, if not already present
    virtual RecordResult Record(const ProofIdentity& identity, const Subject& subject) = 0;

    /// Check whether an identity has been recorded
    virtual bool IsRecorded(const ProofIdentity& identity) const = 0;

    /// Latest recorded identity for a subject
    virtual std::optional<ProofIdentity> GetLatest(const Subject& subject) const = 0;
};

// ============================================================================
// Database-backed Ledger
// ============================================================================

/**
 * Ledger over a key-value database.
 *
 * Keys:
 *   'v' + identity (32 bytes) -> 0x01
 *   'l' + subject bytes       -> identity (32 bytes)
 */
class DatabaseLedgerStore : public ILedgerStore {
public:
    /// Take ownership of a database
    explicit DatabaseLedgerStore(std::unique_ptr<db::Database> database,
                                 bool syncWrites = false);

    /// Ledger over a fresh in-memory database
    DatabaseLedgerStore();

    RecordResult Record(const ProofIdentity& identity, const Subject& subject) override;
    bool IsRecorded(const ProofIdentity& identity) const override;
    std::optional<ProofIdentity> GetLatest(const Subject& subject) const override;

    /// Number of recorded identities
    size_t CountRecorded() const;

private:
    std::unique_ptr<db::Database> db_;
    db::WriteOptions writeOptions_;

    /// Serializes Record against itself and against readers
    mutable std::mutex mutex_;
};

/// Ledger backend selection
enum class LedgerBackend {
    Memory,
    LevelDB,
};

/// Parse "memory" or "leveldb"
std::optional<LedgerBackend> ParseLedgerBackend(const std::string& name);

/// Options for opening a ledger
struct LedgerOptions {
    LedgerBackend backend{LedgerBackend::LevelDB};
    std::filesystem::path path;
    bool syncWrites{true};
};

/**
 * Build ledger options from configuration.
 *
 * ledger defaults to leveldb when the build has it, else memory.
 * ledgerdir defaults to <datadir>/ledger. syncwrites defaults to true.
 *
 * @param error Receives a description if a value is invalid
 */
std::optional<LedgerOptions> LoadLedgerOptions(const util::ConfigManager& config,
                                               std::string* error = nullptr);

/**
 * Open a ledger store.
 * @return (status, store). The store is null unless status is ok.
 */
std::pair<db::Status, std::unique_ptr<DatabaseLedgerStore>> OpenLedgerStore(
    const LedgerOptions& options);

} // namespace ledger
} // namespace zkrange

#endif // ZKRANGE_LEDGER_LEDGER_H
