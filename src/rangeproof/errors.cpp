// ZKRANGE - Verification Error Taxonomy Implementation
// Copyright (c) 2024 ZKRANGE Developers
// MIT License

#include "zkrange/rangeproof/errors.h"

namespace zkrange {
namespace rangeproof {

const char* VerifyErrorToString(VerifyError error) {
    switch (error) {
        case VerifyError::None: return "None";
        case VerifyError::InvalidParameters: return "InvalidParameters";
        case VerifyError::InvalidRange: return "InvalidRange";
        case VerifyError::InvalidSubject: return "InvalidSubject";
        case VerifyError::MalformedProofShape: return "MalformedProofShape";
        case VerifyError::DuplicateProof: return "DuplicateProof";
        case VerifyError::InvalidChallengeY: return "InvalidChallengeY";
        case VerifyError::InvalidChallengeZ: return "InvalidChallengeZ";
        case VerifyError::InvalidChallengeX: return "InvalidChallengeX";
        case VerifyError::CommitmentMismatch: return "CommitmentMismatch";
        case VerifyError::PolynomialMismatch: return "PolynomialMismatch";
        case VerifyError::ZeroField: return "ZeroField";
        case VerifyError::NonDistinctCommitments: return "NonDistinctCommitments";
        case VerifyError::IppLengthMismatch: return "IppLengthMismatch";
        case VerifyError::IppLevelMismatch: return "IppLevelMismatch";
        case VerifyError::LedgerUnavailable: return "LedgerUnavailable";
        default: return "Unknown";
    }
}

const char* ErrorClassToString(ErrorClass cls) {
    switch (cls) {
        case ErrorClass::None: return "none";
        case ErrorClass::MalformedInput: return "malformed-input";
        case ErrorClass::InvalidProof: return "invalid-proof";
        case ErrorClass::AlreadyVerified: return "already-verified";
        case ErrorClass::Internal: return "internal";
        default: return "unknown";
    }
}

ErrorClass ClassifyError(VerifyError error) {
    switch (error) {
        case VerifyError::None:
            return ErrorClass::None;

        case VerifyError::InvalidParameters:
        case VerifyError::InvalidRange:
        case VerifyError::InvalidSubject:
        case VerifyError::MalformedProofShape:
            return ErrorClass::MalformedInput;

        case VerifyError::DuplicateProof:
            return ErrorClass::AlreadyVerified;

        case VerifyError::LedgerUnavailable:
            return ErrorClass::Internal;

        case VerifyError::InvalidChallengeY:
        case VerifyError::InvalidChallengeZ:
        case VerifyError::InvalidChallengeX:
        case VerifyError::CommitmentMismatch:
        case VerifyError::PolynomialMismatch:
        case VerifyError::ZeroField:
        case VerifyError::NonDistinctCommitments:
        case VerifyError::IppLengthMismatch:
        case VerifyError::IppLevelMismatch:
            return ErrorClass::InvalidProof;
    }
    return ErrorClass::InvalidProof;
}

} // namespace rangeproof
} // namespace zkrange
