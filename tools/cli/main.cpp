#include <cstdlib>
#include <iostream>
#include <string>

#include <cuproof/core/log.h>
#include <cuproof/protocol/cuproof_io.h>

using namespace cuproof;

namespace {

const int trusted_setup_bits = 2048;

enum { exit_ok = 0, exit_failure = 1, exit_usage = 2 };

int usage() {
  std::cerr << "Usage:\n"
               "  setup [fast|trusted] <params_path>\n"
               "  prove <params_path> <a_hex> <b_hex> <v_hex> <proof_path>\n"
               "  verify <params_path> <proof_path>\n";
  return exit_usage;
}

int cmd_setup(const std::string& mode, const std::string& path) {
  pedersen_params_t params;
  if (mode == "fast") {
    params = pedersen_params_t::fast_test_setup();
  } else if (mode == "trusted") {
    if (pedersen_params_t::trusted_setup(trusted_setup_bits, params)) {
      std::cerr << "Trusted setup failed\n";
      return exit_failure;
    }
  } else {
    std::cerr << "mode must be fast or trusted\n";
    return exit_usage;
  }

  if (save_params(path, params)) {
    std::cerr << "Failed to save params to " << path << "\n";
    return exit_failure;
  }
  std::cout << "Saved public parameters to " << path << "\n";
  return exit_ok;
}

int cmd_prove(const std::string& params_path, const std::string& a_hex, const std::string& b_hex,
              const std::string& v_hex, const std::string& proof_path) {
  bn_t a, b, v;
  if (hex_to_bn(a_hex, a) || hex_to_bn(b_hex, b) || hex_to_bn(v_hex, v)) {
    std::cerr << "Bounds and value must be hex numbers\n";
    return exit_usage;
  }

  pedersen_params_t params;
  if (load_params(params_path, params)) {
    std::cerr << "Failed to load params from " << params_path << "\n";
    return exit_failure;
  }

  // the blinding stays with the prover
  bn_t r = random_bn(256);

  // an out-of-range value still gets a proof file, one that verifies as INVALID
  if (crypto::check_right_open_range(a, v, b)) std::cerr << "Value is outside [a, b); the proof will not verify\n";
  range_proof_t proof = cuproof_prove(v, r, a, b, params.g, params.h, params.N);

  if (save_proof(proof_path, proof)) {
    std::cerr << "Failed to save proof to " << proof_path << "\n";
    return exit_failure;
  }
  std::cout << "Saved proof to " << proof_path << "\n";
  return exit_ok;
}

int cmd_verify(const std::string& params_path, const std::string& proof_path) {
  pedersen_params_t params;
  if (load_params(params_path, params)) {
    std::cerr << "Failed to load params from " << params_path << "\n";
    return exit_failure;
  }

  range_proof_t proof;
  if (load_proof(proof_path, proof)) {
    std::cerr << "Failed to load proof from " << proof_path << "\n";
    return exit_failure;
  }

  bool ok = cuproof_verify(proof, params.g, params.h, params.N);
  std::cout << (ok ? "VALID" : "INVALID") << "\n";
  return exit_ok;
}

}  // namespace

int main(int argc, const char* argv[]) {
  const char* silent = std::getenv("CUPROOF_LOG_SILENT");
  dylog_disable_scope_t log_scope(!(silent && *silent && std::string(silent) != "0"));

  if (argc < 2) return usage();
  std::string cmd = argv[1];

  try {
    if (cmd == "setup") {
      if (argc != 4) return usage();
      return cmd_setup(argv[2], argv[3]);
    }
    if (cmd == "prove") {
      if (argc != 7) return usage();
      return cmd_prove(argv[2], argv[3], argv[4], argv[5], argv[6]);
    }
    if (cmd == "verify") {
      if (argc != 4) return usage();
      return cmd_verify(argv[2], argv[3]);
    }
  } catch (const assertion_failed_t& e) {
    std::cerr << "Internal error: " << e.what() << "\n";
    return exit_failure;
  }

  std::cerr << "Unknown command: " << cmd << "\n";
  return usage();
}
