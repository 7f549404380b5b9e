#include "zk_ipp.h"

#include <cuproof/zk/fiat_shamir.h>

namespace cuproof::zk {

void ipp_proof_t::prove(std::vector<bn_t> l, std::vector<bn_t> r, const crypto::pedersen_params_t& params) {
  const mod_t& N = params.N;
  int n = int(l.size());
  cp_assert(n == int(r.size()));
  cp_assert(n > 0 && (n & (n - 1)) == 0);

  L.clear();
  R.clear();

  while (n > 1) {
    int half = n / 2;

    bn_t c_left = 0;
    bn_t c_right = 0;
    MODULO(N) {
      for (int i = 0; i < half; i++) {
        c_left += l[i] * r[half + i];
        c_right += l[half + i] * r[i];
      }
    }

    bn_t L_j = params.commit(c_left, N.rand());
    bn_t R_j = params.commit(c_right, N.rand());

    bn_t u = fiat_shamir(L_j, R_j) % N;
    if (u == 0) u = 1;

    std::vector<bn_t> l_next(half);
    std::vector<bn_t> r_next(half);
    MODULO(N) {
      for (int i = 0; i < half; i++) {
        l_next[i] = l[i] + u * l[half + i];
        r_next[i] = u * r[i] + r[half + i];
      }
    }

    L.push_back(std::move(L_j));
    R.push_back(std::move(R_j));
    l = std::move(l_next);
    r = std::move(r_next);
    n = half;
  }
}

error_t ipp_shape_verifier_t::verify(const ipp_proof_t& proof, const crypto::pedersen_params_t& params) const {
  if (proof.L.size() != proof.R.size()) return cuproof::error(E_CRYPTO, "inner product proof: L and R differ in length");
  if (int(proof.L.size()) != range_param_t::ipp_rounds)
    return cuproof::error(E_CRYPTO, "inner product proof: wrong number of rounds");
  return SUCCESS;
}

const ipp_shape_verifier_t& ipp_shape_verifier_t::get() {  // static
  static const ipp_shape_verifier_t verifier{};
  return verifier;
}

}  // namespace cuproof::zk
