#include "fiat_shamir.h"

namespace cuproof::zk {

bn_t fiat_shamir(const std::vector<bn_t>& inputs) {
  crypto::sha256_t h;
  for (const bn_t& input : inputs) h.update(input.to_string());
  return bn_t::from_bin(h.final());
}

}  // namespace cuproof::zk
