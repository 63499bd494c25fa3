// ZKRANGE - Verification Check Tests
// Copyright (c) 2024 ZKRANGE Developers
// MIT License
//
// Tests for the commitment, polynomial and structural checks in isolation.

#include <gtest/gtest.h>
#include "zkrange/rangeproof/commitment.h"
#include "zkrange/rangeproof/polynomial.h"
#include "zkrange/rangeproof/structure.h"
#include "proof_fixture.h"

namespace zkrange {
namespace test {

using namespace rangeproof;

class ChecksTest : public ::testing::Test {
protected:
    void SetUp() override {
        params = TestParameters();
        proof = MakeValidProof(params);
        x = Challenge({proof.T1, proof.T2}, params.n);
    }

    PublicParameters params;
    RangeProof proof;
    BigScalar x;
};

// ============================================================================
// Pedersen Commitments
// ============================================================================

TEST(PedersenTest, SmallModulus) {
    PublicParameters params{Scalar(2), Scalar(3), Scalar(1000)};
    // 2^5 * 3^2 = 288
    EXPECT_EQ(PedersenCommit(params, Scalar(5), Scalar(2)), Scalar(288));
    // 2^10 * 3^1 = 3072 = 72 mod 1000
    EXPECT_EQ(PedersenCommit(params, Scalar(10), Scalar(1)), Scalar(72));
}

TEST(PedersenTest, ZeroOpeningIsOne) {
    PublicParameters params = TestParameters();
    EXPECT_EQ(PedersenCommit(params, BigScalar(), BigScalar()), Scalar(1));
}

TEST_F(ChecksTest, TermCommitmentsPass) {
    EXPECT_TRUE(CheckTermCommitments(params, proof).ok());
}

TEST_F(ChecksTest, TermCommitmentT1Mismatch) {
    proof.tau1 = Scalar(99);
    CheckOutcome outcome = CheckTermCommitments(params, proof);
    EXPECT_EQ(outcome.error, VerifyError::CommitmentMismatch);
    EXPECT_EQ(outcome.field, "T1");
}

TEST_F(ChecksTest, TermCommitmentT2Mismatch) {
    proof.t2 = Scalar(99);
    CheckOutcome outcome = CheckTermCommitments(params, proof);
    EXPECT_EQ(outcome.error, VerifyError::CommitmentMismatch);
    EXPECT_EQ(outcome.field, "T2");
}

TEST_F(ChecksTest, T1CheckedBeforeT2) {
    proof.t1 = Scalar(99);
    proof.t2 = Scalar(99);
    EXPECT_EQ(CheckTermCommitments(params, proof).field, "T1");
}

// ============================================================================
// Polynomial Relation
// ============================================================================

TEST(PolynomialTest, EvaluateSmall) {
    RangeProof proof;
    proof.t0 = Scalar(1);
    proof.t1 = Scalar(2);
    proof.t2 = Scalar(3);
    // 1 + 2*5 + 3*25 = 86
    EXPECT_EQ(EvaluatePolynomial(proof, Scalar(5), Scalar(1000)), Scalar(86));
    // 86 mod 7 = 2
    EXPECT_EQ(EvaluatePolynomial(proof, Scalar(5), Scalar(7)), Scalar(2));
}

TEST_F(ChecksTest, PolynomialPasses) {
    EXPECT_TRUE(CheckPolynomialRelation(params, proof, x).ok());
}

TEST_F(ChecksTest, PolynomialMismatchOnTHat) {
    proof.t_hat = crypto::AddMod(proof.t_hat, Scalar(1), params.n);
    CheckOutcome outcome = CheckPolynomialRelation(params, proof, x);
    EXPECT_EQ(outcome.error, VerifyError::PolynomialMismatch);
    EXPECT_TRUE(outcome.field.empty());
}

TEST_F(ChecksTest, PolynomialMismatchOnCoefficient) {
    proof.t0 = Scalar(7);
    EXPECT_EQ(CheckPolynomialRelation(params, proof, x).error, VerifyError::PolynomialMismatch);
}

TEST_F(ChecksTest, PolynomialMismatchOnChallenge) {
    BigScalar other = crypto::AddMod(x, Scalar(1), params.n);
    EXPECT_EQ(CheckPolynomialRelation(params, proof, other).error,
              VerifyError::PolynomialMismatch);
}

TEST_F(ChecksTest, UnreducedTHatRejected) {
    // t_hat + n is congruent but not equal to the reduced evaluation
    RangeProof small;
    small.t0 = Scalar(1);
    PublicParameters p{Scalar(2), Scalar(3), Scalar(7)};
    small.t_hat = Scalar(8);
    EXPECT_EQ(CheckPolynomialRelation(p, small, Scalar(3)).error,
              VerifyError::PolynomialMismatch);
    small.t_hat = Scalar(1);
    EXPECT_TRUE(CheckPolynomialRelation(p, small, Scalar(3)).ok());
}

// ============================================================================
// Structure
// ============================================================================

TEST_F(ChecksTest, StructurePasses) {
    EXPECT_TRUE(CheckStructure(proof, params.n, 6).ok());
}

TEST_F(ChecksTest, ZeroFieldNamesField) {
    const char* names[] = {"A", "S", "T1", "T2", "C", "C_v1", "C_v2"};
    BigScalar RangeProof::*members[] = {
        &RangeProof::A, &RangeProof::S, &RangeProof::T1, &RangeProof::T2,
        &RangeProof::C, &RangeProof::C_v1, &RangeProof::C_v2,
    };

    for (size_t i = 0; i < 7; ++i) {
        RangeProof bad = proof;
        bad.*members[i] = BigScalar();
        CheckOutcome outcome = CheckStructure(bad, params.n, 6);
        EXPECT_EQ(outcome.error, VerifyError::ZeroField) << names[i];
        EXPECT_EQ(outcome.field, names[i]);
    }
}

TEST_F(ChecksTest, MultipleOfModulusIsZero) {
    proof.S = params.n;
    CheckOutcome outcome = CheckStructure(proof, params.n, 6);
    EXPECT_EQ(outcome.error, VerifyError::ZeroField);
    EXPECT_EQ(outcome.field, "S");
}

TEST_F(ChecksTest, OtherZeroFieldsAllowed) {
    proof.tau_x = BigScalar();
    proof.mu = BigScalar();
    proof.ippA = BigScalar();
    proof.ippL[0] = BigScalar();
    EXPECT_TRUE(CheckStructure(proof, params.n, 6).ok());
}

TEST_F(ChecksTest, NonDistinctCommitments) {
    RangeProof a = proof;
    a.C_v1 = a.C;
    EXPECT_EQ(CheckStructure(a, params.n, 6).error, VerifyError::NonDistinctCommitments);

    RangeProof b = proof;
    b.C_v2 = b.C;
    EXPECT_EQ(CheckStructure(b, params.n, 6).error, VerifyError::NonDistinctCommitments);

    RangeProof c = proof;
    c.C_v2 = c.C_v1;
    EXPECT_EQ(CheckStructure(c, params.n, 6).error, VerifyError::NonDistinctCommitments);
}

TEST_F(ChecksTest, ZeroFieldBeforeDistinctness) {
    proof.C = BigScalar();
    proof.C_v1 = BigScalar();
    CheckOutcome outcome = CheckStructure(proof, params.n, 6);
    EXPECT_EQ(outcome.error, VerifyError::ZeroField);
    EXPECT_EQ(outcome.field, "C");
}

TEST_F(ChecksTest, IppLengthMismatch) {
    proof.ippR.pop_back();
    EXPECT_EQ(CheckStructure(proof, params.n, 6).error, VerifyError::IppLengthMismatch);
}

TEST_F(ChecksTest, IppLevelMismatch) {
    proof.ippL.pop_back();
    proof.ippR.pop_back();
    EXPECT_EQ(CheckStructure(proof, params.n, 6).error, VerifyError::IppLevelMismatch);
    EXPECT_TRUE(CheckStructure(proof, params.n, 5).ok());
}

TEST_F(ChecksTest, LengthCheckedBeforeLevel) {
    proof.ippL.push_back(Scalar(1));
    EXPECT_EQ(CheckStructure(proof, params.n, 6).error, VerifyError::IppLengthMismatch);
}

} // namespace test
} // namespace zkrange
