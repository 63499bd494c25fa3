// ZKRANGE - Range Proof Verifier
// Copyright (c) 2024 ZKRANGE Developers
// MIT License
//
// Verification pipeline: input validation, replay check, challenge
// derivation, commitment and polynomial checks, structural checks, and
// recording of accepted proofs in the ledger.

#ifndef ZKRANGE_RANGEPROOF_VERIFIER_H
#define ZKRANGE_RANGEPROOF_VERIFIER_H

#include "zkrange/core/types.h"
#include "zkrange/ledger/ledger.h"
#include "zkrange/rangeproof/errors.h"
#include "zkrange/rangeproof/identity.h"
#include "zkrange/rangeproof/proof.h"
#include "zkrange/rangeproof/transcript.h"

#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace zkrange {

namespace util {
class ConfigManager;
}

namespace rangeproof {

// ============================================================================
// Verifier Options
// ============================================================================

struct VerifierOptions {
    /// Bit width of the supported range family; sets the IPP round count
    size_t rangeBits{DEFAULT_RANGE_BITS};

    /// Sync ledger writes to disk before reporting acceptance (applied when the ledger is opened)
    bool syncWrites{true};

    /// Expected inner-product rounds for rangeBits
    size_t Rounds() const { return IppRoundsForBits(rangeBits); }

    /// rangeBits is a power of two in [2, MAX_RANGE_BITS]
    bool IsValid() const;
};

/**
 * Build verifier options from configuration.
 *
 * @param config Configuration (rangebits, syncwrites)
 * @param error Receives a description if a value is invalid
 * @return Options, or nullopt on an invalid value
 */
std::optional<VerifierOptions> LoadVerifierOptions(const util::ConfigManager& config,
                                                   std::string* error = nullptr);

// ============================================================================
// Results and Events
// ============================================================================

/**
 * Outcome of a verification call.
 */
struct VerificationResult {
    /// None on acceptance
    VerifyError error{VerifyError::None};

    /// Offending field for CommitmentMismatch and ZeroField
    std::string field;

    /// Set once the identity has been computed
    std::optional<ProofIdentity> identity;

    /// Set once the challenges have been derived
    std::optional<Challenges> challenges;

    /// Time the call completed
    Timestamp timestamp{0};

    bool IsAccepted() const { return error == VerifyError::None; }

    /// Human readable summary
    std::string ToString() const;
};

/**
 * Emitted once per accepted proof.
 */
struct VerificationEvent {
    Subject subject;
    ProofIdentity identity;
    BigScalar rangeMin;
    BigScalar rangeMax;
    bool accepted{true};
    Timestamp timestamp{0};
};

/**
 * Listener for verification events.
 */
class IVerificationListener {
public:
    virtual ~IVerificationListener() = default;

    /// Called after an accepted proof has been recorded
    virtual void OnProofVerified(const VerificationEvent& event) = 0;

    /// Called on rejection; rejections are never recorded
    virtual void OnProofRejected(const Subject& /*subject*/, VerifyError /*error*/) {}
};

// ============================================================================
// Range Proof Verifier
// ============================================================================

/**
 * Verifies range proofs and records accepted ones.
 *
 * Safe to share across threads. Replay protection is linearized by
 * ILedgerStore::Record: for a given identity exactly one concurrent caller
 * is accepted.
 */
class RangeProofVerifier {
public:
    /// @throws std::invalid_argument if options are invalid
    explicit RangeProofVerifier(ledger::ILedgerStore& ledger,
                                VerifierOptions options = VerifierOptions());

    RangeProofVerifier(const RangeProofVerifier&) = delete;
    RangeProofVerifier& operator=(const RangeProofVerifier&) = delete;

    /**
     * Verify a proof that value lies in [range.min, range.max] for subject.
     *
     * The first failing stage determines the error. No failure modifies
     * the ledger.
     */
    VerificationResult Verify(const PublicParameters& params,
                              const RangeProof& proof,
                              const RangeClaim& range,
                              const Subject& subject);

    /**
     * Decode the flattened layout, then Verify.
     * A wrong field count or length marker yields MalformedProofShape.
     */
    VerificationResult VerifyFlat(const PublicParameters& params,
                                  const std::vector<BigScalar>& fields,
                                  const RangeClaim& range,
                                  const Subject& subject);

    /// Check whether a proof identity has been accepted
    bool IsVerified(const ProofIdentity& identity) const;

    /// Identity of the latest accepted proof for a subject
    std::optional<ProofIdentity> GetLatestIdentity(const Subject& subject) const;

    /// Add a listener
    void AddListener(IVerificationListener* listener);

    /// Remove a listener
    void RemoveListener(IVerificationListener* listener);

    const VerifierOptions& GetOptions() const { return options_; }

private:
    /// Run every stage up to (not including) the ledger commit
    VerificationResult RunChecks(const PublicParameters& params,
                                 const RangeProof& proof,
                                 const RangeClaim& range,
                                 const Subject& subject) const;

    /// Stamp, log and report a rejected result
    void ReportRejection(VerificationResult& result, const Subject& subject);

    /// Copy of the listener list taken under the lock
    std::vector<IVerificationListener*> SnapshotListeners() const;
    void NotifyVerified(const VerificationEvent& event);
    void NotifyRejected(const Subject& subject, VerifyError error);

    ledger::ILedgerStore& ledger_;
    VerifierOptions options_;

    mutable std::mutex listenersMutex_;
    std::vector<IVerificationListener*> listeners_;
};

} // namespace rangeproof
} // namespace zkrange

#endif // ZKRANGE_RANGEPROOF_VERIFIER_H
