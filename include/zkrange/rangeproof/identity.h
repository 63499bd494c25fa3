// ZKRANGE - Proof Identity
// Copyright (c) 2024 ZKRANGE Developers
// MIT License
//
// Content-derived identifier of a proof, used as the replay-protection key.
// The proof is encoded as a single dynamic ABI tuple and hashed with
// Keccak-256, so identities match those computed by contract-side tooling.

#ifndef ZKRANGE_RANGEPROOF_IDENTITY_H
#define ZKRANGE_RANGEPROOF_IDENTITY_H

#include "zkrange/core/types.h"
#include "zkrange/rangeproof/proof.h"

#include <vector>

namespace zkrange {
namespace rangeproof {

/// Identity of a proof (256-bit)
class ProofIdentity : public Hash256 {
public:
    using Hash256::Hash256;
    ProofIdentity() = default;
    explicit ProofIdentity(const Hash256& h) : Hash256(h) {}

    static ProofIdentity FromHex(const std::string& hex) {
        return ProofIdentity(Hash256::FromHex(hex));
    }
};

/**
 * Canonical identity encoding.
 *
 * Word layout (32 bytes each):
 *   0x20 (tuple head offset)
 *   15 scalars in canonical order
 *   offset of L, offset of R (relative to the tuple head)
 *   ippA, ippB
 *   len(L), L...
 *   len(R), R...
 */
std::vector<Byte> EncodeProofForIdentity(const RangeProof& proof);

/// Keccak-256 of EncodeProofForIdentity(proof)
ProofIdentity ComputeProofIdentity(const RangeProof& proof);

} // namespace rangeproof
} // namespace zkrange

#endif // ZKRANGE_RANGEPROOF_IDENTITY_H
