#pragma once

#include <cuproof/crypto/base.h>

namespace cuproof::zk {

/**
 * SHA-256 over the concatenated base-10 text of the inputs, read as an unsigned big-endian integer.
 * Negative inputs keep their leading '-'. The result is not reduced.
 */
bn_t fiat_shamir(const std::vector<bn_t>& inputs);

template <typename... ARGS>
bn_t fiat_shamir(const bn_t& first, const ARGS&... rest) {
  return fiat_shamir(std::vector<bn_t>{first, rest...});
}

}  // namespace cuproof::zk
