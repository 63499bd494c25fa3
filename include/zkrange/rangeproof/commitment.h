// ZKRANGE - Pedersen Commitment Checks
// Copyright (c) 2024 ZKRANGE Developers
// MIT License

#ifndef ZKRANGE_RANGEPROOF_COMMITMENT_H
#define ZKRANGE_RANGEPROOF_COMMITMENT_H

#include "zkrange/rangeproof/errors.h"
#include "zkrange/rangeproof/proof.h"

namespace zkrange {
namespace rangeproof {

/**
 * Pedersen commitment g^m * h^r mod n.
 */
BigScalar PedersenCommit(const PublicParameters& params,
                         const BigScalar& m, const BigScalar& r);

/**
 * Check that T1 and T2 open to (t1, tau1) and (t2, tau2).
 *
 * @return CommitmentMismatch with field "T1" or "T2" on the first failure
 */
CheckOutcome CheckTermCommitments(const PublicParameters& params, const RangeProof& proof);

} // namespace rangeproof
} // namespace zkrange

#endif // ZKRANGE_RANGEPROOF_COMMITMENT_H
