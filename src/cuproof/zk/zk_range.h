#pragma once

#include <cuproof/crypto/pedersen.h>
#include <cuproof/zk/zk_ipp.h>
#include <cuproof/zk/zk_util.h>

namespace cuproof::zk {

/**
 * Non-interactive range proof that a committed value v lies in [a, b), over a Pedersen group with
 * an RSA modulus. Challenges are derived with fiat_shamir over the preceding commitments.
 */
struct range_proof_t {
  inline static constexpr uint64_t format_code = 0x4355505246000001;  // "CUPRF", version 1

  bn_t A, S;
  bn_t C, C_v1, C_v2;
  bn_t T1, T2;
  bn_t t0, t1, t2;
  bn_t tau1, tau2, tau_x;
  bn_t t_hat;
  ipp_proof_t ipp;

  void convert(cuproof::converter_t& converter) {
    converter.convert_code_type(format_code);
    converter.convert(A, S, C, C_v1, C_v2, T1, T2, t0, t1, t2, tau1, tau2, tau_x, t_hat, ipp);
  }

  /**
   * Proves that v is in [a, b) under the blinding r, with C = commit(v, r).
   * Only the low range_bits bits of v - a are decomposed. For a value outside the interval every
   * scalar field is still filled but no inner-product rounds are produced and E_RANGE is returned.
   */
  error_t prove(const crypto::pedersen_params_t& params, const bn_t& v, const bn_t& r, const bn_t& a, const bn_t& b);

  /**
   * Checks, in order: nonzero challenges, the openings of T1 and T2, t_hat against the polynomial,
   * the commitment to t_hat, the inner-product proof, nonzero commitments, and distinct C, C_v1, C_v2.
   * Stops at the first failing check.
   */
  error_t verify(const crypto::pedersen_params_t& params,
                 const ipp_verifier_t& ipp_verifier = ipp_shape_verifier_t::get()) const;
};

}  // namespace cuproof::zk
