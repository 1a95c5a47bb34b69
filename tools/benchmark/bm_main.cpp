#include <benchmark/benchmark.h>

#include <edsig/crypto/hash_config.h>

int main(int argc, char** argv) {
  char arg0_default[] = "benchmark";
  char* args_default = arg0_default;
  if (!argv) {
    argc = 1;
    argv = &args_default;
  }
  edsig::crypto::hash_config_t config;
  if (edsig::crypto::hash_config_t::from_env(config) == SUCCESS)
    ::benchmark::AddCustomContext("Hash", config.keyed() ? "hmac-sha512" : config.to_string());
  ::benchmark::Initialize(&argc, argv);
  if (::benchmark::ReportUnrecognizedArguments(argc, argv)) return 1;
  ::benchmark::RunSpecifiedBenchmarks();
  ::benchmark::Shutdown();
  return 0;
}