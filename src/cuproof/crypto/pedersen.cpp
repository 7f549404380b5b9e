#include "pedersen.h"

#include <cuproof/core/log.h>

namespace cuproof::crypto {

bn_t mod_exp(const bn_t& base, const bn_t& exp, const mod_t& modulus) { return modulus.pow(base.abs(), exp.abs()); }

bn_t mod_exp(const bn_t& base, const bn_t& exp, const bn_t& modulus) { return mod_exp(base, exp, mod_t(modulus)); }

bn_t pedersen_commit(const bn_t& g, const bn_t& h, const bn_t& m, const bn_t& r, const mod_t& n) {
  return n.mul(mod_exp(g, m, n), mod_exp(h, r, n));
}

bn_t pedersen_commit(const bn_t& g, const bn_t& h, const bn_t& m, const bn_t& r, const bn_t& n) {
  return pedersen_commit(g, h, m, r, mod_t(n));
}

static bn_t random_square(const mod_t& N) {
  bn_t a;
  do {
    a = N.rand();
  } while (a <= 1 || !mod_t::coprime(a, N));
  return N.mul(a, a);
}

error_t pedersen_params_t::trusted_setup(int bits, pedersen_params_t& params) {  // static
  LOG_FRAME(LOG(bits));
  if (bits < 16 || (bits & 1)) return cuproof::error(E_BADARG, "modulus size must be even and at least 16 bits");

  bn_t p, q, n;
  do {
    p = bn_t::generate_prime(bits / 2);
    do {
      q = bn_t::generate_prime(bits / 2);
    } while (q == p);
    n = p * q;
  } while (n.get_bits_count() != bits);

  mod_t N(n);
  bn_t g, h;
  do {
    g = random_square(N);
    h = random_square(N);
  } while (g <= 1 || h <= 1 || g == h);

  params.N = std::move(N);
  params.g = std::move(g);
  params.h = std::move(h);
  return SUCCESS;
}

const pedersen_params_t& pedersen_params_t::fast_test_setup() {  // static
  static const pedersen_params_t params = [] {
    bn_t p = (bn_t(1) << 127) - 1;
    bn_t q = (bn_t(1) << 89) - 1;
    mod_t N(p * q);

    std::string label = "cuproof fast test setup h";
    bn_t sqrt_h = N.mod(bn_t::from_bin(sha256_t::hash(label)));
    return pedersen_params_t(N, 4, N.mul(sqrt_h, sqrt_h));
  }();
  return params;
}

}  // namespace cuproof::crypto
