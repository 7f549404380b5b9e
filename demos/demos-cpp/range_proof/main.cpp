#include <iostream>

#include <cuproof/protocol/cuproof.h>

using namespace cuproof;

bn_t commit_and_add(const pedersen_params_t& params)
{
  const mod_t& N = params.N;
  bn_t r1 = N.rand();
  bn_t r2 = N.rand();

  // commitments multiply to a commitment of the sum
  bn_t c = N.mul(params.commit(20, r1), params.commit(22, r2));
  std::cout << "commit(20) * commit(22) == commit(42): " << (c == params.commit(42, r1 + r2)) << "\n";
  return c;
}

bool prove_in_range(const pedersen_params_t& params, const bn_t& v, const bn_t& a, const bn_t& b)
{
  const bn_t& n = params.N.value();
  range_proof_t proof = cuproof_prove(v, random_bn(128), a, b, params.g, params.h, n);
  std::cout << "proof size: " << ser(proof).size() << " bytes\n";
  return cuproof_verify(proof, params.g, params.h, n);
}

int main(int argc, const char* argv[])
{
  std::cout << "================ setup ===============\n";
  pedersen_params_t params;
  error_t rv = pedersen_params_t::trusted_setup(1024, params);
  if (rv) return 1;
  std::cout << "n bits: " << params.N.get_bits_count() << "\n";
  std::cout << "g = " << params.g.to_string() << "\n";

  std::cout << "============== commitment ============\n";
  commit_and_add(params);

  std::cout << "============== range proof ===========\n";
  std::cout << "18 in [18, 120): " << (prove_in_range(params, 18, 18, 120) ? "VALID" : "INVALID") << "\n";
  std::cout << "120 in [18, 120): " << (prove_in_range(params, 120, 18, 120) ? "VALID" : "INVALID") << "\n";
  return 0;
}
