#pragma once

#include <cuproof/crypto/base.h>

namespace cuproof::zk {

struct range_param_t {
  // width of the proven interval, in bits
  inline static constexpr int range_bits = 64;
  // number of inner-product folding rounds, log2(range_bits)
  inline static constexpr int ipp_rounds = 6;

  static_assert((1 << ipp_rounds) == range_bits);
};

}  // namespace cuproof::zk
