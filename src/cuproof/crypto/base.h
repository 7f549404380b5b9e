#pragma once

#include <cuproof/core/convert.h>
#include <cuproof/core/strext.h>

enum { E_CRYPTO = ERRCODE(ECATEGORY_CRYPTO, 1) };

namespace cuproof::crypto {
class bn_t;
class mod_t;
}  // namespace cuproof::crypto

// clang-format off
// Order matters here
#include "base_bn.h"
#include "base_mod.h"
#include "base_hash.h"
// clang-format on

using cuproof::crypto::bn_t;
using cuproof::crypto::mod_t;
