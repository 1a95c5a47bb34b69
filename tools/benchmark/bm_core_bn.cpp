#include <benchmark/benchmark.h>

#include <edsig/crypto/ec25519_field.h>

using namespace edsig::crypto;

static bn_t random_field_element() { return ed25519::from_le(gen_random(32)) % ed25519::p(); }

static void BM_ModAdd(benchmark::State& state) {
  const mod_t& q = ed25519::p();
  bn_t a = random_field_element();
  bn_t b = random_field_element();
  for (auto _ : state) auto _dummy = q.add(a, b);
}
BENCHMARK(BM_ModAdd)->Name("Core/BN/ModAdd");

static void BM_ModMul(benchmark::State& state) {
  const mod_t& q = ed25519::p();
  bn_t a = random_field_element();
  bn_t b = random_field_element();
  for (auto _ : state) auto _dummy = q.mul(a, b);
}
BENCHMARK(BM_ModMul)->Name("Core/BN/ModMultiply");

static void BM_ModExp(benchmark::State& state) {
  bn_t a = random_field_element();
  bn_t e = random_field_element();
  for (auto _ : state) auto _dummy = ed25519::expmod(a, e, ed25519::p());
}
BENCHMARK(BM_ModExp)->Name("Core/BN/ModExponentiate");

static void BM_ModInv(benchmark::State& state) {
  bn_t a = random_field_element();
  for (auto _ : state) auto _dummy = ed25519::inv(a);
}
BENCHMARK(BM_ModInv)->Name("Core/BN/ModInvert");
