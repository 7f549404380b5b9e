#pragma once

#include <cuproof/crypto/pedersen.h>
#include <cuproof/zk/zk_util.h>

namespace cuproof::zk {

// Cross-term commitments of the inner-product folding, one (L, R) pair per round.
struct ipp_proof_t {
  std::vector<bn_t> L;
  std::vector<bn_t> R;

  void convert(cuproof::converter_t& converter) { converter.convert(L, R); }

  /**
   * Folds l and r down to a single element. Each round commits <l_lo, r_hi> and <l_hi, r_lo>,
   * derives u from the pair, and sets l' = l_lo + u*l_hi, r' = u*r_lo + r_hi (mod n).
   * The vector length must be a power of two.
   */
  void prove(std::vector<bn_t> l, std::vector<bn_t> r, const crypto::pedersen_params_t& params);
};

class ipp_verifier_t {
 public:
  virtual ~ipp_verifier_t() {}
  virtual error_t verify(const ipp_proof_t& proof, const crypto::pedersen_params_t& params) const = 0;
};

// Accepts any proof with exactly range_param_t::ipp_rounds pairs. The commitments themselves are
// not checked.
class ipp_shape_verifier_t : public ipp_verifier_t {
 public:
  error_t verify(const ipp_proof_t& proof, const crypto::pedersen_params_t& params) const override;

  static const ipp_shape_verifier_t& get();
};

}  // namespace cuproof::zk
