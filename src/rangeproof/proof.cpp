// ZKRANGE - Range Proof Data Model Implementation
// Copyright (c) 2024 ZKRANGE Developers
// MIT License

#include "zkrange/rangeproof/proof.h"

#include <stdexcept>

namespace zkrange {
namespace rangeproof {

// ============================================================================
// Configuration
// ============================================================================

size_t IppRoundsForBits(size_t rangeBits) {
    size_t rounds = 0;
    size_t span = 1;
    while (span < rangeBits) {
        span <<= 1;
        ++rounds;
    }
    return rounds;
}

// ============================================================================
// PublicParameters
// ============================================================================

bool PublicParameters::IsValid() const {
    if (g.IsZero() || h.IsZero() || n.IsZero()) {
        return false;
    }
    return g < n && h < n;
}

// ============================================================================
// RangeProof
// ============================================================================

namespace {

const char* const SCALAR_NAMES[PROOF_SCALAR_COUNT] = {
    "A", "S", "T1", "T2", "tau_x", "mu", "t_hat", "C", "C_v1", "C_v2",
    "t0", "t1", "t2", "tau1", "tau2"
};

} // anonymous namespace

const BigScalar& RangeProof::ScalarAt(size_t index) const {
    switch (index) {
        case 0: return A;
        case 1: return S;
        case 2: return T1;
        case 3: return T2;
        case 4: return tau_x;
        case 5: return mu;
        case 6: return t_hat;
        case 7: return C;
        case 8: return C_v1;
        case 9: return C_v2;
        case 10: return t0;
        case 11: return t1;
        case 12: return t2;
        case 13: return tau1;
        case 14: return tau2;
        default: throw std::out_of_range("RangeProof scalar index");
    }
}

BigScalar& RangeProof::ScalarAt(size_t index) {
    return const_cast<BigScalar&>(static_cast<const RangeProof&>(*this).ScalarAt(index));
}

const char* RangeProof::ScalarName(size_t index) {
    return index < PROOF_SCALAR_COUNT ? SCALAR_NAMES[index] : "";
}

bool RangeProof::operator==(const RangeProof& other) const {
    for (size_t i = 0; i < PROOF_SCALAR_COUNT; ++i) {
        if (ScalarAt(i) != other.ScalarAt(i)) return false;
    }
    return ippL == other.ippL && ippR == other.ippR &&
           ippA == other.ippA && ippB == other.ippB;
}

// ============================================================================
// Flattened Layout
// ============================================================================

std::vector<BigScalar> FlattenProof(const RangeProof& proof) {
    std::vector<BigScalar> fields;
    fields.reserve(PROOF_SCALAR_COUNT + proof.ippL.size() + proof.ippR.size() + 4);

    for (size_t i = 0; i < PROOF_SCALAR_COUNT; ++i) {
        fields.push_back(proof.ScalarAt(i));
    }
    fields.push_back(BigScalar::FromInt(proof.ippL.size()));
    fields.insert(fields.end(), proof.ippL.begin(), proof.ippL.end());
    fields.push_back(BigScalar::FromInt(proof.ippR.size()));
    fields.insert(fields.end(), proof.ippR.begin(), proof.ippR.end());
    fields.push_back(proof.ippA);
    fields.push_back(proof.ippB);

    return fields;
}

std::optional<RangeProof> UnflattenProof(const std::vector<BigScalar>& fields,
                                         size_t rounds) {
    if (fields.size() != FlatProofSize(rounds)) {
        return std::nullopt;
    }

    const BigScalar marker = BigScalar::FromInt(rounds);
    const size_t lMarkerPos = PROOF_SCALAR_COUNT;
    const size_t rMarkerPos = lMarkerPos + 1 + rounds;

    if (fields[lMarkerPos] != marker || fields[rMarkerPos] != marker) {
        return std::nullopt;
    }

    RangeProof proof;
    for (size_t i = 0; i < PROOF_SCALAR_COUNT; ++i) {
        proof.ScalarAt(i) = fields[i];
    }
    proof.ippL.assign(fields.begin() + lMarkerPos + 1, fields.begin() + rMarkerPos);
    proof.ippR.assign(fields.begin() + rMarkerPos + 1,
                      fields.begin() + rMarkerPos + 1 + rounds);
    proof.ippA = fields[rMarkerPos + 1 + rounds];
    proof.ippB = fields[rMarkerPos + 2 + rounds];

    return proof;
}

} // namespace rangeproof
} // namespace zkrange
