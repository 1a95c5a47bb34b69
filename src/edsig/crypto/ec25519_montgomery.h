#pragma once

#include <edsig/crypto/ec25519_core.h>
#include <edsig/crypto/hash_config.h>

namespace edsig::crypto::ed25519 {

enum class key_kind_e {
  secret_key = 0,
  public_key = 1,
};

// Montgomery u = (1 + y) / (1 - y) of an Edwards point, little-endian 32 bytes.
buf_t montgomery_u(const ec25519_core::point_t& a);

/**
 * Maps an Ed25519 key to the matching X25519 key.
 * public_key: decodes the point (E_FORMAT / E_INVALID_POINT on failure) and returns its u coordinate.
 * secret_key: returns the clamped first half of hash(key).
 * Any other kind is rejected with E_BADARG.
 */
error_t to_curve25519(const hash_fn_t& hash, mem_t key, key_kind_e which, buf_t& out);

}  // namespace edsig::crypto::ed25519
