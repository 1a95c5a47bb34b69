#pragma once

#include <edsig/crypto/base.h>

namespace edsig::crypto {

// Any bytes -> bytes function. Ed25519 splits the digest in two halves, so it must be at least 64 bytes.
typedef std::function<buf_t(mem_t)> hash_fn_t;

/**
 * Textual selection of the Ed25519 hash:
 *   "sha512"              SHA-512 (default)
 *   "sha3-512"            SHA3-512
 *   "blake2b512"          BLAKE2b with 512-bit output, "blake2b" is accepted too
 *   "hmac-sha512:<hex>"   HMAC-SHA512 keyed with the hex encoded key
 */
class hash_config_t {
 public:
  static constexpr const char* env_var = "EDSIG_HASH";

  hash_config_t() = default;

  static error_t from_string(const std::string& text, hash_config_t& out);

  // Reads env_var; an absent or empty variable selects SHA-512.
  static error_t from_env(hash_config_t& out);

  std::string to_string() const;
  hash_fn_t hash_fn() const;

  hash_e type() const { return alg; }
  bool keyed() const { return !hmac_key.empty(); }

 private:
  hash_e alg = hash_e::sha512;
  buf_t hmac_key;
};

/**
 * The process-wide hash, resolved from the environment on first use and fixed afterwards.
 * Throws assertion_failed_t if the environment names an unusable hash.
 */
const hash_fn_t& default_hash_fn();

}  // namespace edsig::crypto
