// ZKRANGE - Verification Error Taxonomy
// Copyright (c) 2024 ZKRANGE Developers
// MIT License
//
// Error kinds returned by every verification stage. Checks report errors as
// values; nothing on the verification path throws.

#ifndef ZKRANGE_RANGEPROOF_ERRORS_H
#define ZKRANGE_RANGEPROOF_ERRORS_H

#include <string>
#include <utility>

namespace zkrange {
namespace rangeproof {

// ============================================================================
// Verification Errors
// ============================================================================

/// Reason a verification was rejected
enum class VerifyError {
    None = 0,

    // Input shape
    InvalidParameters,
    InvalidRange,
    InvalidSubject,
    MalformedProofShape,

    // Ledger
    DuplicateProof,

    // Transcript
    InvalidChallengeY,
    InvalidChallengeZ,
    InvalidChallengeX,

    // Commitments and polynomial
    CommitmentMismatch,
    PolynomialMismatch,

    // Structure
    ZeroField,
    NonDistinctCommitments,
    IppLengthMismatch,
    IppLevelMismatch,

    // Store failed while committing; nothing was recorded
    LedgerUnavailable,
};

/// Stable name of an error kind
const char* VerifyErrorToString(VerifyError error);

/// Coarse classification used when triaging failed submissions
enum class ErrorClass {
    None,
    MalformedInput,   ///< Caller supplied bad parameters, range, subject or shape
    InvalidProof,     ///< Proof does not verify against the parameters
    AlreadyVerified,  ///< Benign duplicate
    Internal,         ///< Storage failure
};

const char* ErrorClassToString(ErrorClass cls);

/// Map an error kind to its class
ErrorClass ClassifyError(VerifyError error);

// ============================================================================
// Check Outcome
// ============================================================================

/**
 * Result of a single verification check.
 *
 * field names the offending proof field for CommitmentMismatch and ZeroField.
 */
struct CheckOutcome {
    VerifyError error{VerifyError::None};
    std::string field;

    bool ok() const { return error == VerifyError::None; }

    static CheckOutcome Pass() { return {}; }
    static CheckOutcome Fail(VerifyError err, std::string fieldName = "") {
        return {err, std::move(fieldName)};
    }
};

} // namespace rangeproof
} // namespace zkrange

#endif // ZKRANGE_RANGEPROOF_ERRORS_H
