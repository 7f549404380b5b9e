#pragma once

#include <cuproof/protocol/cuproof.h>

namespace cuproof {

// Files hold one line: the lower-case hex of the binary serialization.

error_t save_params(const std::string& path, const pedersen_params_t& params);
error_t load_params(const std::string& path, pedersen_params_t& params);

error_t save_proof(const std::string& path, const range_proof_t& proof);
error_t load_proof(const std::string& path, range_proof_t& proof);

}  // namespace cuproof
