#include "zk_range.h"

#include <cuproof/zk/fiat_shamir.h>

namespace cuproof::zk {

static const int max_sampling_attempts = 1000;

static bn_t inner_product(const std::vector<bn_t>& a, const std::vector<bn_t>& b) {
  bn_t result = 0;
  for (size_t i = 0; i < a.size(); i++) result += a[i] * b[i];
  return result;
}

error_t range_proof_t::prove(const crypto::pedersen_params_t& params, const bn_t& v, const bn_t& r, const bn_t& a,
                             const bn_t& b) {
  const int n_bits = range_param_t::range_bits;
  const mod_t& N = params.N;

  bn_t v1 = v - a;
  bn_t v2 = b - 1 - v;
  bool in_range = v1 >= 0 && v2 >= 0;

  C = params.commit(v, r);

  int attempts = 0;
  do {
    if (++attempts > max_sampling_attempts) return cuproof::error(E_CRYPTO, "unable to sample distinct commitments");
    C_v1 = params.commit(v1, N.rand());
    C_v2 = params.commit(v2, N.rand());
  } while (C == C_v1 || C == C_v2 || C_v1 == C_v2);

  std::vector<bn_t> aL(n_bits), aR(n_bits), sL(n_bits), sR(n_bits), two_i(n_bits);
  bn_t sum_aL = 0;
  bn_t sum_sL = 0;
  for (int i = 0; i < n_bits; i++) {
    two_i[i] = bn_t(1) << i;
    // low range_bits bits of v1
    aL[i] = v1.is_bit_set(i) ? 1 : 0;
    aR[i] = aL[i] - 1;
    sL[i] = N.rand();
    sR[i] = N.rand();
    sum_aL += aL[i] * two_i[i];
    sum_sL += sL[i] * two_i[i];
  }

  bn_t y, z;
  attempts = 0;
  do {
    if (++attempts > max_sampling_attempts) return cuproof::error(E_CRYPTO, "unable to derive nonzero challenges y, z");
    A = params.commit(sum_aL, N.rand());
    S = params.commit(sum_sL, N.rand());
    y = fiat_shamir(A, S, C, C_v1, C_v2) % N;
    z = fiat_shamir(y) % N;
  } while (y == 0 || z == 0);

  bn_t z2 = z * z;
  std::vector<bn_t> y_i(n_bits);
  y_i[0] = N.mod(1);
  for (int i = 1; i < n_bits; i++) y_i[i] = N.mul(y_i[i - 1], y);

  // l(X) = l0 + l1*X, r(X) = r0 + r1*X, over the integers
  std::vector<bn_t> l0(n_bits), l1(n_bits), r0(n_bits), r1(n_bits);
  for (int i = 0; i < n_bits; i++) {
    l0[i] = aL[i] - z;
    l1[i] = sL[i];
    r0[i] = y_i[i] * (aR[i] + z) + z2 * two_i[i];
    r1[i] = y_i[i] * sR[i];
  }

  t0 = inner_product(l0, r0);
  t1 = inner_product(l0, r1) + inner_product(l1, r0);
  t2 = inner_product(l1, r1);

  bn_t x;
  attempts = 0;
  do {
    if (++attempts > max_sampling_attempts) return cuproof::error(E_CRYPTO, "unable to derive a nonzero challenge x");
    tau1 = N.rand();
    tau2 = N.rand();
    T1 = params.commit(t1, tau1);
    T2 = params.commit(t2, tau2);
    x = fiat_shamir(T1, T2) % N;
  } while (x == 0);

  std::vector<bn_t> lx(n_bits), rx(n_bits);
  for (int i = 0; i < n_bits; i++) {
    lx[i] = l0[i] + l1[i] * x;
    rx[i] = r0[i] + r1[i] * x;
  }

  t_hat = inner_product(lx, rx);
  tau_x = tau2 * x * x + tau1 * x + z2 * r;

  ipp.L.clear();
  ipp.R.clear();
  if (!in_range) return cuproof::error(E_RANGE, "value is outside the proven range");

  ipp.prove(std::move(lx), std::move(rx), params);
  return SUCCESS;
}

error_t range_proof_t::verify(const crypto::pedersen_params_t& params, const ipp_verifier_t& ipp_verifier) const {
  error_t rv = UNINITIALIZED_ERROR;
  const mod_t& N = params.N;

  bn_t y = fiat_shamir(A, S, C, C_v1, C_v2) % N;
  if (y == 0) return cuproof::error(E_CRYPTO, "challenge y is zero");
  bn_t z = fiat_shamir(y) % N;
  if (z == 0) return cuproof::error(E_CRYPTO, "challenge z is zero");
  bn_t x = fiat_shamir(T1, T2) % N;
  if (x == 0) return cuproof::error(E_CRYPTO, "challenge x is zero");

  if (params.commit(t1, tau1) != T1) return cuproof::error(E_CRYPTO, "T1 does not open to t1");
  if (params.commit(t2, tau2) != T2) return cuproof::error(E_CRYPTO, "T2 does not open to t2");

  bn_t t_expected = t0 + t1 * x + t2 * x * x;
  if (t_hat != t_expected) return cuproof::error(E_CRYPTO, "t_hat does not match t0 + t1*x + t2*x^2");

  if (params.commit(t_hat, tau_x) != params.commit(t_expected, tau_x))
    return cuproof::error(E_CRYPTO, "commitment to t_hat does not match");

  if (rv = ipp_verifier.verify(ipp, params)) return rv;

  const bn_t* commitments[] = {&A, &S, &T1, &T2, &C, &C_v1, &C_v2};
  for (const bn_t* c : commitments) {
    if (N.mod(*c) == 0) return cuproof::error(E_CRYPTO, "commitment is zero mod n");
  }

  if (C == C_v1 || C == C_v2 || C_v1 == C_v2) return cuproof::error(E_CRYPTO, "C, C_v1 and C_v2 are not distinct");

  return SUCCESS;
}

}  // namespace cuproof::zk
