#include <gtest/gtest.h>

#include <cuproof/zk/fiat_shamir.h>
#include <cuproof/zk/zk_range.h>

#include "utils/test_macros.h"

using namespace cuproof;
using namespace cuproof::zk;
using cuproof::crypto::pedersen_params_t;

namespace {

class ZKRangeProof : public testing::Test {
 protected:
  void SetUp() override {
    a = 10;
    b = 1000;
    v = 100;
    r = params.N.rand();
    ASSERT_OK(proof.prove(params, v, r, a, b));
  }

  const pedersen_params_t& params = pedersen_params_t::fast_test_setup();
  bn_t a, b, v, r;
  range_proof_t proof;
};

class accept_all_ipp_verifier_t : public ipp_verifier_t {
 public:
  error_t verify(const ipp_proof_t& proof, const pedersen_params_t& params) const override { return SUCCESS; }
};

class reject_all_ipp_verifier_t : public ipp_verifier_t {
 public:
  error_t verify(const ipp_proof_t& proof, const pedersen_params_t& params) const override {
    return cuproof::error(E_CRYPTO, "rejected by custom verifier");
  }
};

TEST_F(ZKRangeProof, Completeness) {
  EXPECT_OK(proof.verify(params));
  EXPECT_EQ(proof.C, params.commit(v, r));
  EXPECT_EQ(proof.ipp.L.size(), 6u);
  EXPECT_EQ(proof.ipp.R.size(), 6u);
}

TEST_F(ZKRangeProof, PolynomialOpening) {
  const mod_t& N = params.N;
  bn_t x = fiat_shamir(proof.T1, proof.T2) % N;
  EXPECT_EQ(proof.t_hat, proof.t0 + proof.t1 * x + proof.t2 * x * x);
  EXPECT_EQ(proof.T1, params.commit(proof.t1, proof.tau1));
  EXPECT_EQ(proof.T2, params.commit(proof.t2, proof.tau2));
}

TEST_F(ZKRangeProof, Boundaries) {
  range_proof_t low, high;
  EXPECT_OK(low.prove(params, a, r, a, b));
  EXPECT_OK(low.verify(params));
  EXPECT_OK(high.prove(params, b - 1, r, a, b));
  EXPECT_OK(high.verify(params));
}

TEST_F(ZKRangeProof, FullWidthRange) {
  bn_t lo = 0;
  bn_t hi = bn_t(1) << range_param_t::range_bits;
  range_proof_t full;
  EXPECT_OK(full.prove(params, hi - 1, r, lo, hi));
  EXPECT_OK(full.verify(params));
}

TEST_F(ZKRangeProof, WrongTHat) {
  proof.t_hat.set_bit(0, !proof.t_hat.is_bit_set(0));
  EXPECT_ER_MSG(proof.verify(params), "t_hat does not match");
}

TEST_F(ZKRangeProof, WrongT1) {
  proof.T1 = params.N.mul(proof.T1, params.g);
  EXPECT_ER_MSG(proof.verify(params), "T1 does not open to t1");
}

TEST_F(ZKRangeProof, WrongTau2) {
  proof.tau2 += 1;
  EXPECT_ER_MSG(proof.verify(params), "T2 does not open to t2");
}

TEST_F(ZKRangeProof, EqualCommitments) {
  proof.C_v1 = proof.C;
  EXPECT_ER_MSG(proof.verify(params), "not distinct");
}

TEST_F(ZKRangeProof, ZeroChallengeY) {
  pedersen_params_t unit(1, params.g, params.h);
  EXPECT_ER_MSG(proof.verify(unit), "challenge y is zero");
}

TEST_F(ZKRangeProof, ZeroChallengeZ) {
  // pick n = FS(y) with y < n, so that y survives the reduction and z does not
  bn_t y, fs_y;
  for (int i = 0; i < 64; i++) {
    proof.A += 1;
    y = fiat_shamir(proof.A, proof.S, proof.C, proof.C_v1, proof.C_v2);
    fs_y = fiat_shamir(y);
    if (y < fs_y) break;
  }
  ASSERT_LT(y, fs_y);

  pedersen_params_t forced(fs_y, params.g, params.h);
  EXPECT_ER_MSG(proof.verify(forced), "challenge z is zero");
}

TEST_F(ZKRangeProof, ZeroChallengeX) {
  pedersen_params_t forced(fiat_shamir(proof.T1, proof.T2), params.g, params.h);
  EXPECT_ER_MSG(proof.verify(forced), "challenge x is zero");
}

TEST_F(ZKRangeProof, UnequalIppLengths) {
  proof.ipp.L.pop_back();
  EXPECT_ER_MSG(proof.verify(params), "L and R differ in length");
}

TEST_F(ZKRangeProof, WrongIppRounds) {
  range_proof_t shorter = proof;
  shorter.ipp.L.pop_back();
  shorter.ipp.R.pop_back();
  EXPECT_ER_MSG(shorter.verify(params), "wrong number of rounds");

  range_proof_t longer = proof;
  longer.ipp.L.push_back(proof.C);
  longer.ipp.R.push_back(proof.C);
  EXPECT_ER_MSG(longer.verify(params), "wrong number of rounds");
}

TEST_F(ZKRangeProof, IppContentsAreNotChecked) {
  for (auto& L : proof.ipp.L) L = 1;
  EXPECT_OK(proof.verify(params));
}

TEST_F(ZKRangeProof, OutOfRange) {
  struct {
    bn_t v, a, b;
  } cases[] = {
      {9, 10, 1000},                                  // below the lower bound
      {1000, 10, 1000},                               // at the upper bound
      {1, -5, 0},                                     // above a negative upper bound
  };

  for (const auto& c : cases) {
    range_proof_t bad;
    EXPECT_ER_MSG(bad.prove(params, c.v, r, c.a, c.b), "outside the proven range");
    EXPECT_TRUE(bad.ipp.L.empty());
    EXPECT_TRUE(bad.ipp.R.empty());
    EXPECT_ER_MSG(bad.verify(params), "wrong number of rounds");
  }
}

TEST_F(ZKRangeProof, WideInterval) {
  bn_t two_64 = bn_t(1) << 64;
  struct {
    bn_t v, a, b;
  } cases[] = {
      {two_64, 0, two_64 + 1},          // v - a needs 65 bits
      {1, 0, bn_t(1) << 65},            // b - 1 - v needs 65 bits
      {two_64 * 3 + 5, 2, two_64 * 4},  // both sides wider than 64 bits
  };

  for (const auto& c : cases) {
    range_proof_t wide;
    EXPECT_OK(wide.prove(params, c.v, r, c.a, c.b));
    EXPECT_EQ(wide.ipp.L.size(), 6u);
    EXPECT_OK(wide.verify(params));
  }
}

TEST_F(ZKRangeProof, NegativeBounds) {
  range_proof_t neg;
  EXPECT_OK(neg.prove(params, -20, r, -100, 5));
  EXPECT_OK(neg.verify(params));
}

TEST_F(ZKRangeProof, PluggableIppVerifier) {
  EXPECT_ER_MSG(proof.verify(params, reject_all_ipp_verifier_t()), "rejected by custom verifier");

  range_proof_t bad;
  EXPECT_ER(bad.prove(params, 5, r, a, b));
  EXPECT_OK(bad.verify(params, accept_all_ipp_verifier_t()));
}

TEST_F(ZKRangeProof, Convert) {
  range_proof_t out;
  buf_t bin = ser(proof);
  ASSERT_OK(deser(bin, out));
  EXPECT_TRUE(ser(out) == bin);
  EXPECT_OK(out.verify(params));

  EXPECT_ER(deser(bin.take(bin.size() - 1), out));
  EXPECT_ER(deser(bin + mem_t("x"), out));

  buf_t wrong_code = bin;
  wrong_code[0] ^= 0x01;
  EXPECT_ER(deser(wrong_code, out));
}

TEST_F(ZKRangeProof, ConvertAcceptsAnyIppLength) {
  range_proof_t shorter = proof;
  shorter.ipp.L.resize(2);
  shorter.ipp.R.resize(3);

  range_proof_t out;
  ASSERT_OK(deser(ser(shorter), out));
  EXPECT_EQ(out.ipp.L.size(), 2u);
  EXPECT_EQ(out.ipp.R.size(), 3u);
}

bn_t range_proof_t::*const commitment_fields[] = {&range_proof_t::A,  &range_proof_t::S, &range_proof_t::T1,
                                                   &range_proof_t::T2, &range_proof_t::C, &range_proof_t::C_v1,
                                                   &range_proof_t::C_v2};

class ZKRangeProofZeroCommitment : public ZKRangeProof, public testing::WithParamInterface<int> {};

TEST_P(ZKRangeProofZeroCommitment, Rejected) {
  bn_t range_proof_t::*field = commitment_fields[GetParam()];
  // equal to n: nonzero as an integer but zero mod n
  proof.*field = params.N.value();

  if (field == &range_proof_t::T1 || field == &range_proof_t::T2) {
    // an honest opening never commits to zero, so the opening check fails first
    EXPECT_ER_MSG(proof.verify(params), "does not open to");
  } else {
    EXPECT_ER_MSG(proof.verify(params), "commitment is zero mod n");
  }

  proof.*field = params.N.value() * 3;
  EXPECT_ER(proof.verify(params));
}

INSTANTIATE_TEST_SUITE_P(, ZKRangeProofZeroCommitment, testing::Range(0, 7));

TEST(ZKRangeProofDegenerate, IndistinctCommitments) {
  // mod 2 there are too few residues for C, C_v1 and C_v2 to differ
  pedersen_params_t tiny(2, 3, 5);
  range_proof_t proof;
  EXPECT_ER_MSG(proof.prove(tiny, 5, 1, 0, 10), "unable to sample distinct commitments");
  EXPECT_ER(proof.verify(tiny));
}

}  // namespace
