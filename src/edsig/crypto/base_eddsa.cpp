#include "base_eddsa.h"

#include <edsig/core/log.h>

namespace edsig::crypto::ed25519 {

using ec25519_core::point_t;

eddsa_t::eddsa_t() : hash_fn(default_hash_fn()) {}

eddsa_t::eddsa_t(hash_fn_t hash) : hash_fn(std::move(hash)) { edsig_assert(hash_fn); }

buf_t eddsa_t::expand_secret(mem_t secret) const {
  buf_t h = hash_fn(secret);
  edsig_assert(h.size() >= 2 * key_size);
  return h;
}

buf_t eddsa_t::derive_public_key(mem_t secret) const {
  bn_t a = from_le(clamp(expand_secret(secret)));
  return ec25519_core::to_bin(ec25519_core::mul(ec25519_core::get_generator(), a));
}

key_pair_t eddsa_t::generate_key_pair() const { return generate_key_pair(gen_random(key_size)); }

key_pair_t eddsa_t::generate_key_pair(mem_t secret) const {
  key_pair_t key;
  key.secret = secret;
  key.pub = derive_public_key(secret);
  return key;
}

buf_t eddsa_t::sign(mem_t msg, mem_t secret) const { return sign(msg, secret, derive_public_key(secret)); }

buf_t eddsa_t::sign(mem_t msg, mem_t secret, mem_t pub) const {
  buf_t h = expand_secret(secret);
  bn_t a = from_le(clamp(h));

  // r is used unreduced
  bn_t r = from_le(hash_fn(h.range(key_size, key_size) + msg));
  buf_t R = ec25519_core::to_bin(ec25519_core::mul(ec25519_core::get_generator(), r));

  bn_t k = from_le(hash_fn(R + pub + msg));
  bn_t s = order().mod(r + k * a);

  return R + to_le(s, key_size);
}

error_t eddsa_t::verify(mem_t sig, mem_t msg, mem_t pub, bool& valid) const {
  log_frame_t log_frame(_FUNCION_LOG_FORMAT_, LOG(sig.size), LOG(pub.size), LOG(msg.size));
  error_t rv = UNINITIALIZED_ERROR;
  valid = false;

  if (sig.size != signature_size || pub.size != key_size) return SUCCESS;

  mem_t R_bin = sig.take(point_bin_size);
  bn_t S = from_le(sig.skip(point_bin_size));

  point_t R, A;
  if (rv = ec25519_core::from_bin(R, R_bin)) return rv;
  if (rv = ec25519_core::from_bin(A, pub)) return rv;

  bn_t k = from_le(hash_fn(R_bin + pub + msg));

  point_t lhs = ec25519_core::mul(ec25519_core::get_generator(), S);
  point_t rhs = ec25519_core::add(R, ec25519_core::mul(A, k));
  valid = lhs == rhs;
  return SUCCESS;
}

error_t eddsa_t::to_curve25519(mem_t key, key_kind_e which, buf_t& out) const {
  return ed25519::to_curve25519(hash_fn, key, which, out);
}

bool on_curve(mem_t key) {
  dylog_disable_scope_t dylog_disable_scope;
  point_t P;
  return ec25519_core::from_bin(P, key) == SUCCESS;
}

static const eddsa_t& default_eddsa() {
  static const eddsa_t instance;
  return instance;
}

buf_t derive_public_key(mem_t secret) { return default_eddsa().derive_public_key(secret); }
key_pair_t generate_key_pair() { return default_eddsa().generate_key_pair(); }
key_pair_t generate_key_pair(mem_t secret) { return default_eddsa().generate_key_pair(secret); }
buf_t sign(mem_t msg, mem_t secret) { return default_eddsa().sign(msg, secret); }
buf_t sign(mem_t msg, mem_t secret, mem_t pub) { return default_eddsa().sign(msg, secret, pub); }
error_t verify(mem_t sig, mem_t msg, mem_t pub, bool& valid) { return default_eddsa().verify(sig, msg, pub, valid); }
error_t to_curve25519(mem_t key, key_kind_e which, buf_t& out) {
  return default_eddsa().to_curve25519(key, which, out);
}

}  // namespace edsig::crypto::ed25519
