#include <benchmark/benchmark.h>

#include <cuproof/zk/zk_util.h>

int main(int argc, char** argv) {
  char arg0_default[] = "cuproof_benchmark";
  char* args_default = arg0_default;
  if (!argv) {
    argc = 1;
    argv = &args_default;
  }
  ::benchmark::AddCustomContext("Range bits", std::to_string(cuproof::zk::range_param_t::range_bits));
  ::benchmark::Initialize(&argc, argv);
  if (::benchmark::ReportUnrecognizedArguments(argc, argv)) return 1;
  ::benchmark::RunSpecifiedBenchmarks();
  ::benchmark::Shutdown();
  return 0;
}
