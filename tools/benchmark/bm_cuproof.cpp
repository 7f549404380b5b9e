#include <benchmark/benchmark.h>

#include <cuproof/protocol/cuproof.h>
#include <cuproof/zk/fiat_shamir.h>

using namespace cuproof;

static void BM_ModExp(benchmark::State& state) {
  const pedersen_params_t& params = pedersen_params_t::fast_test_setup();
  bn_t e = bn_t::rand_bitlen(state.range(0));
  for (auto _ : state) crypto::mod_exp(params.h, e, params.N);
}
BENCHMARK(BM_ModExp)->Name("Cuproof/ModExp")->RangeMultiplier(4)->Range(64, 4096);

static void BM_Commit(benchmark::State& state) {
  const pedersen_params_t& params = pedersen_params_t::fast_test_setup();
  bn_t m = bn_t::rand_bitlen(64);
  bn_t r = params.N.rand();
  for (auto _ : state) params.commit(m, r);
}
BENCHMARK(BM_Commit)->Name("Cuproof/Pedersen/Commit");

static void BM_FiatShamir(benchmark::State& state) {
  std::vector<bn_t> inputs(5);
  for (auto& x : inputs) x = bn_t::rand_bitlen(2048);
  for (auto _ : state) zk::fiat_shamir(inputs);
}
BENCHMARK(BM_FiatShamir)->Name("Cuproof/FiatShamir/5x2048");

static void BM_TrustedSetup(benchmark::State& state) {
  for (auto _ : state) {
    pedersen_params_t params;
    if (pedersen_params_t::trusted_setup(state.range(0), params)) state.SkipWithError("trusted setup failed");
  }
}
BENCHMARK(BM_TrustedSetup)->Name("Cuproof/Setup/Trusted")->Arg(512)->Arg(1024)->Unit(benchmark::kMillisecond);

static void BM_Prove(benchmark::State& state) {
  const pedersen_params_t& params = pedersen_params_t::fast_test_setup();
  bn_t r = params.N.rand();
  for (auto _ : state) {
    range_proof_t proof;
    if (proof.prove(params, 100, r, 10, 1000)) state.SkipWithError("prove failed");
  }
}
BENCHMARK(BM_Prove)->Name("Cuproof/RangeProof/Prove")->Unit(benchmark::kMillisecond);

static void BM_Verify(benchmark::State& state) {
  const pedersen_params_t& params = pedersen_params_t::fast_test_setup();
  range_proof_t proof;
  if (proof.prove(params, 100, params.N.rand(), 10, 1000)) state.SkipWithError("prove failed");
  for (auto _ : state) proof.verify(params);
}
BENCHMARK(BM_Verify)->Name("Cuproof/RangeProof/Verify")->Unit(benchmark::kMillisecond);

static void BM_Serialize(benchmark::State& state) {
  const pedersen_params_t& params = pedersen_params_t::fast_test_setup();
  range_proof_t proof;
  if (proof.prove(params, 100, params.N.rand(), 10, 1000)) state.SkipWithError("prove failed");
  for (auto _ : state) {
    range_proof_t out;
    deser(ser(proof), out);
  }
}
BENCHMARK(BM_Serialize)->Name("Cuproof/RangeProof/SerDeser");
