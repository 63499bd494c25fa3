// ZKRANGE - Range Proof Verifier Implementation
// Copyright (c) 2024 ZKRANGE Developers
// MIT License

#include "zkrange/rangeproof/verifier.h"
#include "zkrange/rangeproof/commitment.h"
#include "zkrange/rangeproof/polynomial.h"
#include "zkrange/rangeproof/structure.h"
#include "zkrange/util/config.h"
#include "zkrange/util/logging.h"
#include "zkrange/util/time.h"

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace zkrange {
namespace rangeproof {

// ============================================================================
// VerifierOptions
// ============================================================================

bool VerifierOptions::IsValid() const {
    if (rangeBits < 2 || rangeBits > MAX_RANGE_BITS) {
        return false;
    }
    return (rangeBits & (rangeBits - 1)) == 0;
}

std::optional<VerifierOptions> LoadVerifierOptions(const util::ConfigManager& config,
                                                   std::string* error) {
    VerifierOptions options;

    if (config.HasKey(util::ConfigKeys::RANGEBITS)) {
        auto bits = config.TryGetInt(util::ConfigKeys::RANGEBITS);
        if (!bits || *bits < 2 || *bits > static_cast<int64_t>(MAX_RANGE_BITS)) {
            if (error) {
                *error = "rangebits must be an integer in 2.." + std::to_string(MAX_RANGE_BITS);
            }
            return std::nullopt;
        }
        options.rangeBits = static_cast<size_t>(*bits);
        if (!options.IsValid()) {
            if (error) {
                *error = "rangebits must be a power of two, got " + std::to_string(*bits);
            }
            return std::nullopt;
        }
    }

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

// ============================================================================
// VerificationResult
// ============================================================================

std::string VerificationResult::ToString() const {
    std::ostringstream oss;
    if (IsAccepted()) {
        oss << "accepted";
    } else {
        oss << "rejected: " << VerifyErrorToString(error);
        if (!field.empty()) {
            oss << " (" << field << ")";
        }
    }
    if (identity) {
        oss << " identity=" << identity->ToHex();
    }
    return oss.str();
}

// ============================================================================
// RangeProofVerifier
// ============================================================================

RangeProofVerifier::RangeProofVerifier(ledger::ILedgerStore& ledger, VerifierOptions options)
    : ledger_(ledger), options_(options) {
    if (!options_.IsValid()) {
        throw std::invalid_argument("invalid range bit width: " +
                                    std::to_string(options_.rangeBits));
    }
}

VerificationResult RangeProofVerifier::RunChecks(const PublicParameters& params,
                                                 const RangeProof& proof,
                                                 const RangeClaim& range,
                                                 const Subject& subject) const {
    VerificationResult result;

    if (!range.IsValid()) {
        result.error = VerifyError::InvalidRange;
        return result;
    }
    if (subject.IsEmpty()) {
        result.error = VerifyError::InvalidSubject;
        return result;
    }
    if (!params.IsValid()) {
        result.error = VerifyError::InvalidParameters;
        return result;
    }

    result.identity = ComputeProofIdentity(proof);
    if (ledger_.IsRecorded(*result.identity)) {
        result.error = VerifyError::DuplicateProof;
        return result;
    }

    Challenges challenges;
    CheckOutcome outcome = DeriveChallenges(proof, params.n, challenges);
    if (!outcome.ok()) {
        result.error = outcome.error;
        return result;
    }
    result.challenges = challenges;

    outcome = CheckTermCommitments(params, proof);
    if (outcome.ok()) {
        outcome = CheckPolynomialRelation(params, proof, challenges.x);
    }
    if (outcome.ok()) {
        outcome = CheckStructure(proof, params.n, options_.Rounds());
    }

    result.error = outcome.error;
    result.field = outcome.field;
    return result;
}

VerificationResult RangeProofVerifier::Verify(const PublicParameters& params,
                                              const RangeProof& proof,
                                              const RangeClaim& range,
                                              const Subject& subject) {
    ZKRANGE_LOG_TIMER(util::LogCategory::VERIFY, "Verify");

    VerificationResult result = RunChecks(params, proof, range, subject);
    if (!result.IsAccepted()) {
        ReportRejection(result, subject);
        return result;
    }

    switch (ledger_.Record(*result.identity, subject)) {
        case ledger::RecordResult::Recorded:
            break;
        case ledger::RecordResult::AlreadyRecorded:
            result.error = VerifyError::DuplicateProof;
            ReportRejection(result, subject);
            return result;
        case ledger::RecordResult::StoreError:
            result.error = VerifyError::LedgerUnavailable;
            ReportRejection(result, subject);
            return result;
    }

    result.timestamp = util::GetTime();

    VerificationEvent event;
    event.subject = subject;
    event.identity = *result.identity;
    event.rangeMin = range.min;
    event.rangeMax = range.max;
    event.accepted = true;
    event.timestamp = result.timestamp;

    LOG_INFO(util::LogCategory::VERIFY) << "Accepted proof " << event.identity.ToHex()
                                        << " for " << subject.ToString()
                                        << " in [" << range.min.ToDecimal()
                                        << ", " << range.max.ToDecimal() << "]";

    NotifyVerified(event);
    return result;
}

VerificationResult RangeProofVerifier::VerifyFlat(const PublicParameters& params,
                                                  const std::vector<BigScalar>& fields,
                                                  const RangeClaim& range,
                                                  const Subject& subject) {
    auto proof = UnflattenProof(fields, options_.Rounds());
    if (!proof) {
        VerificationResult result;
        result.error = VerifyError::MalformedProofShape;
        ReportRejection(result, subject);
        return result;
    }
    return Verify(params, *proof, range, subject);
}

bool RangeProofVerifier::IsVerified(const ProofIdentity& identity) const {
    return ledger_.IsRecorded(identity);
}

std::optional<ProofIdentity> RangeProofVerifier::GetLatestIdentity(const Subject& subject) const {
    return ledger_.GetLatest(subject);
}

void RangeProofVerifier::ReportRejection(VerificationResult& result, const Subject& subject) {
    result.timestamp = util::GetTime();

    LOG_DEBUG(util::LogCategory::VERIFY) << "Rejected proof for " << subject.ToString()
                                         << ": " << VerifyErrorToString(result.error)
                                         << (result.field.empty() ? "" : " " + result.field);

    NotifyRejected(subject, result.error);
}

// ============================================================================
// Listeners
// ============================================================================

void RangeProofVerifier::AddListener(IVerificationListener* listener) {
    std::lock_guard<std::mutex> lock(listenersMutex_);
    listeners_.push_back(listener);
}

void RangeProofVerifier::RemoveListener(IVerificationListener* listener) {
    std::lock_guard<std::mutex> lock(listenersMutex_);
    listeners_.erase(std::remove(listeners_.begin(), listeners_.end(), listener),
                     listeners_.end());
}

std::vector<IVerificationListener*> RangeProofVerifier::SnapshotListeners() const {
    std::lock_guard<std::mutex> lock(listenersMutex_);
    return listeners_;
}

// Callbacks run without the listener lock so they may add or remove listeners
void RangeProofVerifier::NotifyVerified(const VerificationEvent& event) {
    for (auto* listener : SnapshotListeners()) {
        listener->OnProofVerified(event);
    }
}

void RangeProofVerifier::NotifyRejected(const Subject& subject, VerifyError error) {
    for (auto* listener : SnapshotListeners()) {
        listener->OnProofRejected(subject, error);
    }
}

} // namespace rangeproof
} // namespace zkrange
