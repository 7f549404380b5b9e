#include <gtest/gtest.h>

#include <cuproof/zk/fiat_shamir.h>

#include "utils/test_macros.h"

using namespace cuproof;
using namespace cuproof::zk;

namespace {

bn_t sha256_number(const std::string& transcript) {
  return bn_t::from_bin(crypto::sha256_t::hash(transcript));
}

TEST(FiatShamir, HashesDecimalTranscript) {
  EXPECT_EQ(fiat_shamir(bn_t(1), bn_t(2), bn_t(3)), sha256_number("123"));
  EXPECT_EQ(fiat_shamir(bn_t(255)), sha256_number("255"));
}

TEST(FiatShamir, NoSeparatorBetweenInputs) {
  EXPECT_EQ(fiat_shamir(bn_t(12), bn_t(3)), fiat_shamir(bn_t(1), bn_t(23)));
}

TEST(FiatShamir, NegativeInputsKeepSign) {
  EXPECT_EQ(fiat_shamir(bn_t(-5)), sha256_number("-5"));
  EXPECT_NE(fiat_shamir(bn_t(-5)), fiat_shamir(bn_t(5)));
}

TEST(FiatShamir, EmptyInput) {
  std::vector<bn_t> none;
  EXPECT_EQ(fiat_shamir(none), sha256_number(""));
}

TEST(FiatShamir, DeterministicAndOrderSensitive) {
  bn_t a = bn_t::rand_bitlen(2048);
  bn_t b = bn_t::rand_bitlen(2048);
  bn_t c = bn_t::rand_bitlen(2048);

  EXPECT_EQ(fiat_shamir(a, b, c), fiat_shamir(a, b, c));
  EXPECT_EQ(fiat_shamir({a, b, c}), fiat_shamir(a, b, c));
  EXPECT_NE(fiat_shamir(a, b, c), fiat_shamir(a, c, b));
}

TEST(FiatShamir, UnreducedDigest) {
  bn_t e = fiat_shamir(bn_t(7));
  EXPECT_GE(e, 0);
  EXPECT_LE(e.get_bits_count(), 256);
}

}  // namespace
