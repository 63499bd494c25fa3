// ZKRANGE - Structural Proof Checks Implementation
// Copyright (c) 2024 ZKRANGE Developers
// MIT License

#include "zkrange/rangeproof/structure.h"

#include <utility>

namespace zkrange {
namespace rangeproof {

CheckOutcome CheckStructure(const RangeProof& proof, const BigScalar& n,
                            size_t expectedRounds) {
    const std::pair<const char*, const BigScalar*> nonZeroFields[] = {
        {"A", &proof.A},
        {"S", &proof.S},
        {"T1", &proof.T1},
        {"T2", &proof.T2},
        {"C", &proof.C},
        {"C_v1", &proof.C_v1},
        {"C_v2", &proof.C_v2},
    };

    for (const auto& [name, value] : nonZeroFields) {
        if (crypto::Mod(*value, n).IsZero()) {
            return CheckOutcome::Fail(VerifyError::ZeroField, name);
        }
    }

    if (proof.C == proof.C_v1 || proof.C == proof.C_v2 || proof.C_v1 == proof.C_v2) {
        return CheckOutcome::Fail(VerifyError::NonDistinctCommitments);
    }

    if (proof.ippL.size() != proof.ippR.size()) {
        return CheckOutcome::Fail(VerifyError::IppLengthMismatch);
    }

    if (proof.ippL.size() != expectedRounds) {
        return CheckOutcome::Fail(VerifyError::IppLevelMismatch);
    }

    return CheckOutcome::Pass();
}

} // namespace rangeproof
} // namespace zkrange
