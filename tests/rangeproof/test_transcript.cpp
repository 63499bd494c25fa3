// ZKRANGE - Fiat-Shamir Transcript Tests
// Copyright (c) 2024 ZKRANGE Developers
// MIT License

#include <gtest/gtest.h>
#include "zkrange/rangeproof/transcript.h"
#include "proof_fixture.h"

namespace zkrange {
namespace test {

using namespace rangeproof;

// ============================================================================
// Hashing
// ============================================================================

TEST(TranscriptTest, HashWordsIsKeccakOfPaddedWords) {
    EXPECT_EQ(HashWords({BigScalar()}).ToPaddedHex(),
              "290decd9548b62a8d60345a988386fc84ba6bc95484008f6362f93160ef3e563");
}

TEST(TranscriptTest, ChallengeReducesModN) {
    BigScalar n = Scalar(1000003);
    std::vector<BigScalar> inputs = {Scalar(1), Scalar(2)};
    BigScalar c = Challenge(inputs, n);
    EXPECT_TRUE(c < n);
    EXPECT_EQ(c, crypto::Mod(HashWords(inputs), n));
}

TEST(TranscriptTest, InputOrderMatters) {
    BigScalar n = TestParameters().n;
    EXPECT_NE(Challenge({Scalar(1), Scalar(2)}, n), Challenge({Scalar(2), Scalar(1)}, n));
}

// ============================================================================
// Challenge Derivation
// ============================================================================

TEST(TranscriptTest, DeriveChallengesFromFixture) {
    PublicParameters params = TestParameters();
    RangeProof proof = MakeValidProof(params);

    Challenges ch;
    CheckOutcome outcome = DeriveChallenges(proof, params.n, ch);
    ASSERT_TRUE(outcome.ok());

    EXPECT_EQ(ch.y, Challenge({proof.A, proof.S, proof.C, proof.C_v1, proof.C_v2}, params.n));
    EXPECT_EQ(ch.z, Challenge({ch.y}, params.n));
    EXPECT_EQ(ch.x, Challenge({proof.T1, proof.T2}, params.n));
    EXPECT_FALSE(ch.y.IsZero());
    EXPECT_FALSE(ch.z.IsZero());
    EXPECT_FALSE(ch.x.IsZero());
}

TEST(TranscriptTest, Deterministic) {
    PublicParameters params = TestParameters();
    RangeProof proof = MakeValidProof(params);

    Challenges a, b;
    ASSERT_TRUE(DeriveChallenges(proof, params.n, a).ok());
    ASSERT_TRUE(DeriveChallenges(proof, params.n, b).ok());
    EXPECT_EQ(a, b);
}

TEST(TranscriptTest, YBindsCommitmentsOnly) {
    PublicParameters params = TestParameters();
    RangeProof proof = MakeValidProof(params);
    Challenges base;
    ASSERT_TRUE(DeriveChallenges(proof, params.n, base).ok());

    RangeProof changedS = proof;
    changedS.S = Scalar(987654);
    Challenges ch;
    ASSERT_TRUE(DeriveChallenges(changedS, params.n, ch).ok());
    EXPECT_NE(ch.y, base.y);
    EXPECT_NE(ch.z, base.z);
    EXPECT_EQ(ch.x, base.x);

    RangeProof changedMu = proof;
    changedMu.mu = Scalar(987654);
    ASSERT_TRUE(DeriveChallenges(changedMu, params.n, ch).ok());
    EXPECT_EQ(ch, base);
}

TEST(TranscriptTest, XBindsTermCommitments) {
    PublicParameters params = TestParameters();
    RangeProof proof = MakeValidProof(params);
    Challenges base;
    ASSERT_TRUE(DeriveChallenges(proof, params.n, base).ok());

    RangeProof changed = proof;
    changed.T2 = Scalar(424242);
    Challenges ch;
    ASSERT_TRUE(DeriveChallenges(changed, params.n, ch).ok());
    EXPECT_EQ(ch.y, base.y);
    EXPECT_NE(ch.x, base.x);
}

// ============================================================================
// Zero Challenges
// ============================================================================

namespace {

/// Small modulus under which each of y, z and x can reduce to zero
constexpr uint64_t ZERO_SEARCH_MODULUS = 11;

/// Search A for a proof whose challenges over n fail as wanted
bool FindProofWithZeroChallenge(const BigScalar& n, VerifyError wanted, RangeProof& out) {
    RangeProof proof;
    proof.S = Scalar(2);
    proof.C = Scalar(3);
    proof.C_v1 = Scalar(4);
    proof.C_v2 = Scalar(5);
    proof.T2 = Scalar(6);

    for (uint64_t i = 1; i < 2000; ++i) {
        proof.A = Scalar(i);
        proof.T1 = Scalar(i);
        Challenges ch;
        if (DeriveChallenges(proof, n, ch).error == wanted) {
            out = proof;
            return true;
        }
    }
    return false;
}

} // namespace

TEST(TranscriptTest, ZeroY) {
    BigScalar n = Scalar(ZERO_SEARCH_MODULUS);
    RangeProof proof;
    ASSERT_TRUE(FindProofWithZeroChallenge(n, VerifyError::InvalidChallengeY, proof));

    Challenges ch;
    DeriveChallenges(proof, n, ch);
    EXPECT_TRUE(ch.y.IsZero());
}

TEST(TranscriptTest, ZeroZ) {
    BigScalar n = Scalar(ZERO_SEARCH_MODULUS);
    RangeProof proof;
    ASSERT_TRUE(FindProofWithZeroChallenge(n, VerifyError::InvalidChallengeZ, proof));

    Challenges ch;
    DeriveChallenges(proof, n, ch);
    EXPECT_FALSE(ch.y.IsZero());
    EXPECT_TRUE(ch.z.IsZero());
}

TEST(TranscriptTest, HashOfSmallWordsModulo) {
    EXPECT_TRUE(Challenge({Scalar(2)}, Scalar(11)).IsZero());
    EXPECT_TRUE(Challenge({Scalar(4)}, Scalar(11)).IsZero());
    EXPECT_EQ(Challenge({Scalar(1)}, Scalar(7)), Scalar(3));
    EXPECT_EQ(Challenge({Scalar(2)}, Scalar(7)), Scalar(2));
}

TEST(TranscriptTest, ZeroX) {
    BigScalar n = Scalar(ZERO_SEARCH_MODULUS);
    RangeProof proof;
    ASSERT_TRUE(FindProofWithZeroChallenge(n, VerifyError::InvalidChallengeX, proof));

    Challenges ch;
    DeriveChallenges(proof, n, ch);
    EXPECT_FALSE(ch.y.IsZero());
    EXPECT_FALSE(ch.z.IsZero());
    EXPECT_TRUE(ch.x.IsZero());
}

} // namespace test
} // namespace zkrange
