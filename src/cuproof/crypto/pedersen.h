#pragma once

#include <cuproof/crypto/base.h>

namespace cuproof::crypto {

// base^exp mod modulus, with result in [0, modulus). A negative base or exponent is replaced by its
// absolute value; no modular inverse is taken. The modulus must be positive.
bn_t mod_exp(const bn_t& base, const bn_t& exp, const mod_t& modulus);
bn_t mod_exp(const bn_t& base, const bn_t& exp, const bn_t& modulus);

// g^m * h^r mod n
bn_t pedersen_commit(const bn_t& g, const bn_t& h, const bn_t& m, const bn_t& r, const mod_t& n);
bn_t pedersen_commit(const bn_t& g, const bn_t& h, const bn_t& m, const bn_t& r, const bn_t& n);

// Pedersen commitment group over an RSA modulus of unknown factorization.
struct pedersen_params_t {
  mod_t N;
  bn_t g, h;

  pedersen_params_t() {}
  pedersen_params_t(const bn_t& _N, const bn_t& _g, const bn_t& _h) : N(_N), g(_g), h(_h) {}

  bn_t commit(const bn_t& m, const bn_t& r) const { return pedersen_commit(g, h, m, r, N); }

  void convert(cuproof::converter_t& converter) {
    converter.convert(N, g, h);
    if (converter.is_write() || converter.is_error()) return;
    if (g <= 0 || h <= 0) converter.set_error();
  }

  /**
   * Generates n = p*q of exactly `bits` bits from two fresh primes, and two random quadratic
   * residues g != h. The factors are discarded.
   */
  static error_t trusted_setup(int bits, pedersen_params_t& params);

  // Fixed insecure parameters for tests and benchmarks.
  static const pedersen_params_t& fast_test_setup();
};

}  // namespace cuproof::crypto
