// ZKRANGE - Blinding Polynomial Relation
// Copyright (c) 2024 ZKRANGE Developers
// MIT License

#ifndef ZKRANGE_RANGEPROOF_POLYNOMIAL_H
#define ZKRANGE_RANGEPROOF_POLYNOMIAL_H

#include "zkrange/rangeproof/errors.h"
#include "zkrange/rangeproof/proof.h"

namespace zkrange {
namespace rangeproof {

/// (t0 + t1*x + t2*x^2) mod n
BigScalar EvaluatePolynomial(const RangeProof& proof, const BigScalar& x, const BigScalar& n);

/**
 * Check t_hat against the polynomial evaluated at the challenge x, then
 * check that commit(t_hat, tau_x) equals commit(rhs, tau_x).
 *
 * @return PolynomialMismatch, or CommitmentMismatch with field "t_hat"
 */
CheckOutcome CheckPolynomialRelation(const PublicParameters& params,
                                     const RangeProof& proof,
                                     const BigScalar& x);

} // namespace rangeproof
} // namespace zkrange

#endif // ZKRANGE_RANGEPROOF_POLYNOMIAL_H
