// ZKRANGE - Fiat-Shamir Transcript
// Copyright (c) 2024 ZKRANGE Developers
// MIT License
//
// Deterministic challenge derivation. Each input is encoded as a 32-byte
// big-endian word, the words are concatenated and hashed with Keccak-256,
// and the digest is reduced modulo n.

#ifndef ZKRANGE_RANGEPROOF_TRANSCRIPT_H
#define ZKRANGE_RANGEPROOF_TRANSCRIPT_H

#include "zkrange/rangeproof/errors.h"
#include "zkrange/rangeproof/proof.h"

#include <initializer_list>
#include <vector>

namespace zkrange {
namespace rangeproof {

/// The three challenges of a proof transcript
struct Challenges {
    BigScalar y;
    BigScalar z;  ///< Part of the transcript; not consumed by the current checks
    BigScalar x;

    bool operator==(const Challenges& other) const {
        return y == other.y && z == other.z && x == other.x;
    }
    bool operator!=(const Challenges& other) const { return !(*this == other); }
};

/// Keccak-256 of the concatenated 32-byte encodings, as an integer (not reduced)
BigScalar HashWords(const std::vector<BigScalar>& inputs);

/// HashWords(inputs) mod n
BigScalar Challenge(const std::vector<BigScalar>& inputs, const BigScalar& n);

/**
 * Derive y = H(A, S, C, C_v1, C_v2), z = H(y), x = H(T1, T2), all mod n.
 *
 * @param proof The proof
 * @param n Modulus
 * @param out Receives the challenges derived so far, even on failure
 * @return InvalidChallengeY, InvalidChallengeZ or InvalidChallengeX for the
 *         first challenge that reduces to zero
 */
CheckOutcome DeriveChallenges(const RangeProof& proof, const BigScalar& n,
                              Challenges& out);

} // namespace rangeproof
} // namespace zkrange

#endif // ZKRANGE_RANGEPROOF_TRANSCRIPT_H
