#include "cuproof_io.h"

#include <cuproof/core/log.h>

namespace cuproof {

static error_t write_hex_file(const std::string& path, mem_t bin) {
  std::ofstream file(path, std::ios::out | std::ios::trunc);
  if (!file) return cuproof::error(E_FILE, "cannot open " + path + " for writing");

  file << strext::to_hex(bin) << "\n";
  file.close();
  if (!file) return cuproof::error(E_FILE, "cannot write " + path);
  return SUCCESS;
}

static error_t read_hex_file(const std::string& path, buf_t& bin) {
  std::ifstream file(path);
  if (!file) return cuproof::error(E_NOT_FOUND, "cannot open " + path);

  std::stringstream ss;
  ss << file.rdbuf();
  std::string hex = ss.str();
  strext::trim(hex);

  if (!strext::from_hex(bin, hex)) return cuproof::error(E_FORMAT, "invalid hex content in " + path);
  return SUCCESS;
}

error_t save_params(const std::string& path, const pedersen_params_t& params) {
  return write_hex_file(path, ser(params));
}

error_t load_params(const std::string& path, pedersen_params_t& params) {
  error_t rv = UNINITIALIZED_ERROR;
  LOG_FRAME(LOG(path));

  buf_t bin;
  if (rv = read_hex_file(path, bin)) return rv;
  if (rv = deser(bin, params)) return rv;
  return SUCCESS;
}

error_t save_proof(const std::string& path, const range_proof_t& proof) {
  return write_hex_file(path, ser(proof));
}

error_t load_proof(const std::string& path, range_proof_t& proof) {
  error_t rv = UNINITIALIZED_ERROR;
  LOG_FRAME(LOG(path));

  buf_t bin;
  if (rv = read_hex_file(path, bin)) return rv;
  if (rv = deser(bin, proof)) return rv;
  return SUCCESS;
}

}  // namespace cuproof
