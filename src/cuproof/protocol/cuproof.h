#pragma once

#include <cuproof/crypto/pedersen.h>
#include <cuproof/zk/zk_range.h>

namespace cuproof {

using crypto::pedersen_params_t;
using zk::range_proof_t;

/**
 * Builds a range proof for v in [a, b) with blinding r over the group (g, h, n).
 * An out-of-range value still yields a proof, one that cuproof_verify rejects. So does a group too
 * small to give distinct commitments. Never throws for bad inputs.
 */
range_proof_t cuproof_prove(const bn_t& v, const bn_t& r, const bn_t& a, const bn_t& b, const bn_t& g,
                            const bn_t& h, const bn_t& n);

// Accept/reject only. Failure details are not reported to the caller.
bool cuproof_verify(const range_proof_t& proof, const bn_t& g, const bn_t& h, const bn_t& n);

// The bounds are accepted but not used; the result always equals cuproof_verify.
bool cuproof_verify_with_range(const range_proof_t& proof, const bn_t& g, const bn_t& h, const bn_t& n,
                               const bn_t& a, const bn_t& b);

// Parses a non-negative hex string with an optional 0x prefix.
error_t hex_to_bn(const std::string& hex, bn_t& out);

// Uniform in [0, 2^bits)
bn_t random_bn(int bits);

}  // namespace cuproof
