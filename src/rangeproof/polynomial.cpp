// ZKRANGE - Blinding Polynomial Relation Implementation
// Copyright (c) 2024 ZKRANGE Developers
// MIT License

#include "zkrange/rangeproof/polynomial.h"
#include "zkrange/rangeproof/commitment.h"

namespace zkrange {
namespace rangeproof {

BigScalar EvaluatePolynomial(const RangeProof& proof, const BigScalar& x, const BigScalar& n) {
    BigScalar x2 = crypto::MulMod(x, x, n);
    BigScalar linear = crypto::AddMod(proof.t0, crypto::MulMod(proof.t1, x, n), n);
    return crypto::AddMod(linear, crypto::MulMod(proof.t2, x2, n), n);
}

CheckOutcome CheckPolynomialRelation(const PublicParameters& params,
                                     const RangeProof& proof,
                                     const BigScalar& x) {
    BigScalar rhs = EvaluatePolynomial(proof, x, params.n);

    if (proof.t_hat != rhs) {
        return CheckOutcome::Fail(VerifyError::PolynomialMismatch);
    }

    // Transcript binding step; redundant once t_hat == rhs
    if (PedersenCommit(params, proof.t_hat, proof.tau_x) !=
        PedersenCommit(params, rhs, proof.tau_x)) {
        return CheckOutcome::Fail(VerifyError::CommitmentMismatch, "t_hat");
    }

    return CheckOutcome::Pass();
}

} // namespace rangeproof
} // namespace zkrange
