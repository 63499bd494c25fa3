// ZKRANGE - Pedersen Commitment Checks Implementation
// Copyright (c) 2024 ZKRANGE Developers
// MIT License

#include "zkrange/rangeproof/commitment.h"

namespace zkrange {
namespace rangeproof {

BigScalar PedersenCommit(const PublicParameters& params,
                         const BigScalar& m, const BigScalar& r) {
    BigScalar gm = crypto::ModPow(params.g, m, params.n);
    BigScalar hr = crypto::ModPow(params.h, r, params.n);
    return crypto::MulMod(gm, hr, params.n);
}

CheckOutcome CheckTermCommitments(const PublicParameters& params, const RangeProof& proof) {
    if (PedersenCommit(params, proof.t1, proof.tau1) != proof.T1) {
        return CheckOutcome::Fail(VerifyError::CommitmentMismatch, "T1");
    }
    if (PedersenCommit(params, proof.t2, proof.tau2) != proof.T2) {
        return CheckOutcome::Fail(VerifyError::CommitmentMismatch, "T2");
    }
    return CheckOutcome::Pass();
}

} // namespace rangeproof
} // namespace zkrange
