#pragma once

#include <edsig/crypto/ec25519_core.h>
#include <edsig/crypto/ec25519_montgomery.h>
#include <edsig/crypto/hash_config.h>

namespace edsig::crypto::ed25519 {

struct key_pair_t {
  buf_t secret;
  buf_t pub;
};

/**
 * Ed25519 (RFC 8032 without context) over an injected hash.
 * Keys are raw byte strings: a secret is any seed (normally 32 random bytes), a public key is a compressed point.
 * The object is immutable and may be shared between threads.
 */
class eddsa_t {
 public:
  // Uses the process-wide hash, see default_hash_fn().
  eddsa_t();
  explicit eddsa_t(hash_fn_t hash);

  buf_t derive_public_key(mem_t secret) const;

  key_pair_t generate_key_pair() const;
  key_pair_t generate_key_pair(mem_t secret) const;

  // Derives the public key first.
  buf_t sign(mem_t msg, mem_t secret) const;
  buf_t sign(mem_t msg, mem_t secret, mem_t pub) const;

  /**
   * A signature that is not 64 bytes or a key that is not 32 bytes is reported as valid = false with SUCCESS.
   * Well-sized input whose R or public key does not decode to a curve point returns the decoding error.
   */
  error_t verify(mem_t sig, mem_t msg, mem_t pub, bool& valid) const;

  error_t to_curve25519(mem_t key, key_kind_e which, buf_t& out) const;

 private:
  hash_fn_t hash_fn;

  buf_t expand_secret(mem_t secret) const;
};

// false for anything that does not decode to a curve point; never logs
bool on_curve(mem_t key);

// clang-format off
buf_t      derive_public_key(mem_t secret);
key_pair_t generate_key_pair();
key_pair_t generate_key_pair(mem_t secret);
buf_t      sign(mem_t msg, mem_t secret);
buf_t      sign(mem_t msg, mem_t secret, mem_t pub);
error_t    verify(mem_t sig, mem_t msg, mem_t pub, bool& valid);
error_t    to_curve25519(mem_t key, key_kind_e which, buf_t& out);
// clang-format on

}  // namespace edsig::crypto::ed25519
