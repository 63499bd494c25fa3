// ZKRANGE - Structural Proof Checks
// Copyright (c) 2024 ZKRANGE Developers
// MIT License

#ifndef ZKRANGE_RANGEPROOF_STRUCTURE_H
#define ZKRANGE_RANGEPROOF_STRUCTURE_H

#include "zkrange/rangeproof/errors.h"
#include "zkrange/rangeproof/proof.h"

namespace zkrange {
namespace rangeproof {

/**
 * Shape checks that do not depend on the challenges.
 *
 * In order:
 * - A, S, T1, T2, C, C_v1, C_v2 non-zero mod n (ZeroField, with name)
 * - C, C_v1, C_v2 pairwise distinct (NonDistinctCommitments)
 * - len(L) == len(R) (IppLengthMismatch)
 * - len(L) == expectedRounds (IppLevelMismatch)
 */
CheckOutcome CheckStructure(const RangeProof& proof, const BigScalar& n,
                            size_t expectedRounds);

} // namespace rangeproof
} // namespace zkrange

#endif // ZKRANGE_RANGEPROOF_STRUCTURE_H
