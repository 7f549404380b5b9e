#include "cuproof.h"

#include <cuproof/core/log.h>

namespace cuproof {

range_proof_t cuproof_prove(const bn_t& v, const bn_t& r, const bn_t& a, const bn_t& b, const bn_t& g,
                            const bn_t& h, const bn_t& n) {
  pedersen_params_t params(n, g, h);
  range_proof_t proof;
  // a failed proof carries no inner-product rounds, so cuproof_verify rejects it
  if (proof.prove(params, v, r, a, b)) proof.ipp = zk::ipp_proof_t();
  return proof;
}

bool cuproof_verify(const range_proof_t& proof, const bn_t& g, const bn_t& h, const bn_t& n) {
  if (n <= 0) return false;
  pedersen_params_t params(n, g, h);

  dylog_disable_scope_t no_log_scope;
  return proof.verify(params) == SUCCESS;
}

bool cuproof_verify_with_range(const range_proof_t& proof, const bn_t& g, const bn_t& h, const bn_t& n,
                               const bn_t& a, const bn_t& b) {
  return cuproof_verify(proof, g, h, n);
}

error_t hex_to_bn(const std::string& hex, bn_t& out) {
  std::string s = hex;
  strext::trim(s);
  if (strext::starts_with(strext::to_lower(s), "0x")) s = s.substr(2);

  if (s.empty()) return cuproof::error(E_FORMAT, "empty hex value");
  for (char c : s) {
    if (!isxdigit((unsigned char)c)) return cuproof::error(E_FORMAT, "invalid hex value: " + hex);
  }

  out = bn_t::from_hex(s);
  return SUCCESS;
}

bn_t random_bn(int bits) { return bn_t::rand_bitlen(bits); }

}  // namespace cuproof
