// ZKRANGE - Fiat-Shamir Transcript Implementation
// Copyright (c) 2024 ZKRANGE Developers
// MIT License

#include "zkrange/rangeproof/transcript.h"
#include "zkrange/crypto/keccak.h"

namespace zkrange {
namespace rangeproof {

BigScalar HashWords(const std::vector<BigScalar>& inputs) {
    crypto::Keccak256 hasher;
    for (const auto& word : inputs) {
        hasher.Write(word.data(), BigScalar::SIZE);
    }

    std::array<uint8_t, BigScalar::SIZE> digest;
    hasher.Finalize(digest.data());
    return BigScalar(digest);
}

BigScalar Challenge(const std::vector<BigScalar>& inputs, const BigScalar& n) {
    return crypto::Mod(HashWords(inputs), n);
}

CheckOutcome DeriveChallenges(const RangeProof& proof, const BigScalar& n,
                              Challenges& out) {
    out = Challenges{};

    out.y = Challenge({proof.A, proof.S, proof.C, proof.C_v1, proof.C_v2}, n);
    if (out.y.IsZero()) {
        return CheckOutcome::Fail(VerifyError::InvalidChallengeY);
    }

    out.z = Challenge({out.y}, n);
    if (out.z.IsZero()) {
        return CheckOutcome::Fail(VerifyError::InvalidChallengeZ);
    }

    out.x = Challenge({proof.T1, proof.T2}, n);
    if (out.x.IsZero()) {
        return CheckOutcome::Fail(VerifyError::InvalidChallengeX);
    }

    return CheckOutcome::Pass();
}

} // namespace rangeproof
} // namespace zkrange
