#include <benchmark/benchmark.h>

#include <edsig/crypto/base.h>
#include <edsig/crypto/hash_config.h>

using namespace edsig::crypto;

static void BM_SHA512(benchmark::State& state) {
  buf_t input = gen_random(state.range(0));
  for (auto _ : state) auto _dummy = sha512_t::hash(input);
}
BENCHMARK(BM_SHA512)->Name("Core/Hash/SHA512")->RangeMultiplier(4)->Range(1, 4096);

static void BM_SHA3_512(benchmark::State& state) {
  buf_t input = gen_random(state.range(0));
  for (auto _ : state) auto _dummy = sha3_512_t::hash(input);
}
BENCHMARK(BM_SHA3_512)->Name("Core/Hash/SHA3-512")->RangeMultiplier(4)->Range(1, 4096);

static void BM_BLAKE2B(benchmark::State& state) {
  buf_t input = gen_random(state.range(0));
  for (auto _ : state) auto _dummy = blake2b_t::hash(input);
}
BENCHMARK(BM_BLAKE2B)->Name("Core/Hash/BLAKE2b-512")->RangeMultiplier(4)->Range(1, 4096);

static void BM_HMAC_SHA512(benchmark::State& state) {
  buf_t input = gen_random(state.range(0));
  buf_t key = gen_random(32);

  for (auto _ : state) {
    hmac_sha512_t hmac(key);
    hmac.calculate(input);
  }
}
BENCHMARK(BM_HMAC_SHA512)->Name("Core/Hash/HMAC-SHA512")->RangeMultiplier(4)->Range(1, 4096);

// The configured hash as seen by the signer, including the std::function call
static void BM_ConfiguredHash(benchmark::State& state) {
  buf_t input = gen_random(state.range(0));
  const hash_fn_t& hash = default_hash_fn();
  for (auto _ : state) auto _dummy = hash(input);
}
BENCHMARK(BM_ConfiguredHash)->Name("Core/Hash/Configured")->RangeMultiplier(4)->Range(1, 4096);
