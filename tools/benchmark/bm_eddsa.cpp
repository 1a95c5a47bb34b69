#include <benchmark/benchmark.h>

#include <edsig/crypto/base_eddsa.h>

using namespace edsig;
using namespace edsig::crypto;

static void BM_ed25519_point_add(benchmark::State& state) {
  const ec25519_core::point_t& G = ec25519_core::get_generator();
  ec25519_core::point_t P = ec25519_core::mul(G, bn_t(12345));
  for (auto _ : state) auto _dummy = ec25519_core::add(P, G);
}
BENCHMARK(BM_ed25519_point_add)->Name("EdDSA/Curve/Add");

// 256-bit scalars as in key derivation, 512-bit as the unreduced nonce and challenge
static void BM_ed25519_scalar_mul(benchmark::State& state) {
  bn_t e = ed25519::from_le(gen_random(int(state.range(0) / 8)));
  for (auto _ : state) auto _dummy = ec25519_core::mul(ec25519_core::get_generator(), e);
}
BENCHMARK(BM_ed25519_scalar_mul)->Name("EdDSA/Curve/Multiply")->Arg(256)->Arg(512);

static void BM_ed25519_decode(benchmark::State& state) {
  buf_t pub = ed25519::generate_key_pair().pub;
  ec25519_core::point_t P;
  for (auto _ : state) auto _dummy = ec25519_core::from_bin(P, pub);
}
BENCHMARK(BM_ed25519_decode)->Name("EdDSA/Curve/Decode");

static void BM_ed25519_keygen(benchmark::State& state) {
  for (auto _ : state) ed25519::generate_key_pair();
}
BENCHMARK(BM_ed25519_keygen)->Name("EdDSA/Ed25519/KeyGen");

static void BM_ed25519_sign(benchmark::State& state) {
  ed25519::key_pair_t key = ed25519::generate_key_pair();
  buf_t msg = gen_random(state.range(0));
  for (auto _ : state) ed25519::sign(msg, key.secret, key.pub);
}
BENCHMARK(BM_ed25519_sign)->Name("EdDSA/Ed25519/Sign")->RangeMultiplier(32)->Range(32, 32 << 10);

static void BM_ed25519_verify(benchmark::State& state) {
  ed25519::key_pair_t key = ed25519::generate_key_pair();
  buf_t msg = gen_random(state.range(0));
  buf_t sig = ed25519::sign(msg, key.secret, key.pub);
  bool valid = false;
  for (auto _ : state) {
    error_t rv = ed25519::verify(sig, msg, key.pub, valid);
    if (rv || !valid) state.SkipWithError("verification failed");
  }
}
BENCHMARK(BM_ed25519_verify)->Name("EdDSA/Ed25519/Verify")->RangeMultiplier(32)->Range(32, 32 << 10);

static void BM_ed25519_to_curve25519(benchmark::State& state) {
  buf_t pub = ed25519::generate_key_pair().pub;
  buf_t out;
  for (auto _ : state) auto _dummy = ed25519::to_curve25519(pub, ed25519::key_kind_e::public_key, out);
}
BENCHMARK(BM_ed25519_to_curve25519)->Name("EdDSA/Ed25519/ToCurve25519");
