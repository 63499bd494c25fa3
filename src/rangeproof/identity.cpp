// ZKRANGE - Proof Identity Implementation
// Copyright (c) 2024 ZKRANGE Developers
// MIT License

#include "zkrange/rangeproof/identity.h"
#include "zkrange/crypto/keccak.h"

namespace zkrange {
namespace rangeproof {

namespace {

/// Words in the static head of the tuple: 15 scalars, 2 offsets, a, b
constexpr size_t HEAD_WORDS = PROOF_SCALAR_COUNT + 4;

void AppendWord(std::vector<Byte>& out, const BigScalar& value) {
    out.insert(out.end(), value.data(), value.data() + BigScalar::SIZE);
}

void AppendWord(std::vector<Byte>& out, uint64_t value) {
    AppendWord(out, BigScalar::FromInt(value));
}

void AppendArray(std::vector<Byte>& out, const std::vector<BigScalar>& values) {
    AppendWord(out, static_cast<uint64_t>(values.size()));
    for (const auto& v : values) {
        AppendWord(out, v);
    }
}

} // namespace

std::vector<Byte> EncodeProofForIdentity(const RangeProof& proof) {
    const uint64_t offsetL = HEAD_WORDS * WORD_SIZE;
    const uint64_t offsetR = offsetL + WORD_SIZE * (1 + proof.ippL.size());

    std::vector<Byte> out;
    out.reserve(WORD_SIZE * (1 + HEAD_WORDS + 2 + proof.ippL.size() + proof.ippR.size()));

    AppendWord(out, static_cast<uint64_t>(WORD_SIZE));

    for (size_t i = 0; i < PROOF_SCALAR_COUNT; ++i) {
        AppendWord(out, proof.ScalarAt(i));
    }
    AppendWord(out, offsetL);
    AppendWord(out, offsetR);
    AppendWord(out, proof.ippA);
    AppendWord(out, proof.ippB);

    AppendArray(out, proof.ippL);
    AppendArray(out, proof.ippR);

    return out;
}

ProofIdentity ComputeProofIdentity(const RangeProof& proof) {
    return ProofIdentity(crypto::Keccak256Hash(EncodeProofForIdentity(proof)));
}

} // namespace rangeproof
} // namespace zkrange
