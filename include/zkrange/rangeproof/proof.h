// ZKRANGE - Range Proof Data Model
// Copyright (c) 2024 ZKRANGE Developers
// MIT License
//
// Public parameters, the proof object, range claims and subjects, plus the
// flattened field layout used by array-based callers.

#ifndef ZKRANGE_RANGEPROOF_PROOF_H
#define ZKRANGE_RANGEPROOF_PROOF_H

#include "zkrange/crypto/bigscalar.h"

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace zkrange {
namespace rangeproof {

using crypto::BigScalar;

// ============================================================================
// Range Proof Configuration
// ============================================================================

/// Default bit width of the supported range family
constexpr size_t DEFAULT_RANGE_BITS = 64;

/// Largest supported bit width
constexpr size_t MAX_RANGE_BITS = 256;

/// Number of named scalar fields in a proof
constexpr size_t PROOF_SCALAR_COUNT = 15;

/// Inner-product folding rounds for a bit width: ceil(log2(bits))
size_t IppRoundsForBits(size_t rangeBits);

/// Number of fields in the flattened layout for a given round count
constexpr size_t FlatProofSize(size_t rounds) {
    return PROOF_SCALAR_COUNT + 2 * (1 + rounds) + 2;
}

/// Flattened size for the default configuration (31)
constexpr size_t DEFAULT_FLAT_PROOF_SIZE = FlatProofSize(6);

// ============================================================================
// Public Parameters
// ============================================================================

/**
 * Pedersen generators and modulus shared by prover and verifier.
 */
struct PublicParameters {
    BigScalar g;
    BigScalar h;
    BigScalar n;

    /// g, h, n non-zero and g, h < n
    bool IsValid() const;
};

// ============================================================================
// Range Claim / Subject
// ============================================================================

/// Asserted inclusive bound [min, max]
struct RangeClaim {
    BigScalar min;
    BigScalar max;

    bool IsValid() const { return min <= max; }
};

/**
 * Opaque identifier of the party making a claim.
 *
 * The empty identifier is the invalid sentinel.
 */
class Subject {
public:
    Subject() = default;
    explicit Subject(std::string id) : id_(std::move(id)) {}

    bool IsEmpty() const { return id_.empty(); }
    const std::string& ToString() const { return id_; }

    bool operator==(const Subject& other) const { return id_ == other.id_; }
    bool operator!=(const Subject& other) const { return id_ != other.id_; }
    bool operator<(const Subject& other) const { return id_ < other.id_; }

private:
    std::string id_;
};

// ============================================================================
// Range Proof
// ============================================================================

/**
 * A non-interactive range proof as produced by the prover.
 *
 * Structure:
 * - A, S: commitments to the bit vectors and their blinding
 * - T1, T2: commitments to the blinding polynomial coefficients t1, t2
 * - tau_x, mu, t_hat: opening values
 * - C, C_v1, C_v2: value commitment and the two range-split commitments
 * - t0, t1, t2, tau1, tau2: polynomial coefficients and their blinding
 * - ippL, ippR, ippA, ippB: inner-product argument
 */
struct RangeProof {
    BigScalar A;
    BigScalar S;
    BigScalar T1;
    BigScalar T2;
    BigScalar tau_x;
    BigScalar mu;
    BigScalar t_hat;
    BigScalar C;
    BigScalar C_v1;
    BigScalar C_v2;
    BigScalar t0;
    BigScalar t1;
    BigScalar t2;
    BigScalar tau1;
    BigScalar tau2;

    /// Inner product argument - L values, one per folding round
    std::vector<BigScalar> ippL;

    /// Inner product argument - R values, one per folding round
    std::vector<BigScalar> ippR;

    /// Final scalars
    BigScalar ippA;
    BigScalar ippB;

    /// Named scalar by position in canonical order (0..14)
    const BigScalar& ScalarAt(size_t index) const;
    BigScalar& ScalarAt(size_t index);

    /// Name of the scalar at a canonical position
    static const char* ScalarName(size_t index);

    bool operator==(const RangeProof& other) const;
    bool operator!=(const RangeProof& other) const { return !(*this == other); }
};

// ============================================================================
// Flattened Layout
// ============================================================================

/**
 * Flatten a proof into the self-describing array layout:
 * 15 scalars, len(L), L..., len(R), R..., a, b.
 */
std::vector<BigScalar> FlattenProof(const RangeProof& proof);

/**
 * Decode the flattened layout.
 *
 * @param fields Flattened fields
 * @param rounds Expected length of L and R (both length markers must equal it)
 * @return The proof, or nullopt if the field count or a marker is wrong
 */
std::optional<RangeProof> UnflattenProof(const std::vector<BigScalar>& fields,
                                         size_t rounds = IppRoundsForBits(DEFAULT_RANGE_BITS));

} // namespace rangeproof
} // namespace zkrange

#endif // ZKRANGE_RANGEPROOF_PROOF_H
