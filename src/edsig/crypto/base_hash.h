#pragma once

#include <edsig/core/strext.h>

#include "scope.h"

namespace edsig::crypto {

// Digests that can back the Ed25519 hash. sha256 is too short to sign with and is kept for tests.
enum class hash_e {
  none = NID_undef,
  sha256 = NID_sha256,
  sha512 = NID_sha512,
  sha3_512 = NID_sha3_512,
  blake2b = NID_blake2b512,
};

struct hash_alg_t {
  hash_e type;
  int size;
  const char* name;  // OpenSSL digest name, used for the HMAC parameter
  const EVP_MD* md;

  bool valid() const { return type != hash_e::none; }

  static const hash_alg_t& get(hash_e type);
};

// Incremental digest over EVP_MD_CTX
class hash_t {
 public:
  explicit hash_t(hash_e type);

  hash_t& init();
  hash_t& update(mem_t data);
  buf_t final();

  int size() const { return alg.size; }

 private:
  const hash_alg_t& alg;
  scoped_ptr_t<EVP_MD_CTX> ctx;
};

// One-shot digest of the concatenation of all arguments
template <hash_e type>
struct digest_t {
  template <typename... ARGS>
  static buf_t hash(const ARGS&... parts) {
    hash_t h(type);
    h.init();
    (h.update(mem_t(parts)), ...);
    return h.final();
  }
};

typedef digest_t<hash_e::sha256> sha256_t;
typedef digest_t<hash_e::sha512> sha512_t;
typedef digest_t<hash_e::sha3_512> sha3_512_t;
typedef digest_t<hash_e::blake2b> blake2b_t;

// Keyed digest over EVP_MAC. The context is released by final(), so each instance computes one tag.
class hmac_t {
 public:
  hmac_t(hash_e type, mem_t key);

  hmac_t& update(mem_t data);
  buf_t final();

  template <typename... ARGS>
  buf_t calculate(const ARGS&... parts) {
    (update(mem_t(parts)), ...);
    return final();
  }

 private:
  const hash_alg_t& alg;
  scoped_ptr_t<EVP_MAC_CTX> ctx;
};

class hmac_sha512_t : public hmac_t {
 public:
  explicit hmac_sha512_t(mem_t key) : hmac_t(hash_e::sha512, key) {}
};

}  // namespace edsig::crypto
