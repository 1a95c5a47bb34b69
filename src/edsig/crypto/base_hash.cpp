#include <edsig/crypto/base.h>

namespace edsig::crypto {

const hash_alg_t& hash_alg_t::get(hash_e type) {  // static
  static const hash_alg_t table[] = {
      {hash_e::sha256, 32, "SHA256", EVP_sha256()},
      {hash_e::sha512, 64, "SHA512", EVP_sha512()},
      {hash_e::sha3_512, 64, "SHA3-512", EVP_sha3_512()},
      {hash_e::blake2b, 64, "BLAKE2B-512", EVP_blake2b512()},
  };
  static const hash_alg_t unknown = {hash_e::none, 0, "", nullptr};

  for (const auto& alg : table) {
    if (alg.type == type) return alg;
  }
  return unknown;
}

// ----------------------------------------- hash_t ----------------------------------------

hash_t::hash_t(hash_e type) : alg(hash_alg_t::get(type)) { edsig_assert(alg.valid()); }

hash_t& hash_t::init() {
  if (!ctx) ctx = scoped_ptr_t<EVP_MD_CTX>(EVP_MD_CTX_new());
  edsig_assert(ctx.valid());
  edsig_assert(EVP_DigestInit_ex(ctx, alg.md, nullptr) > 0);
  return *this;
}

hash_t& hash_t::update(mem_t data) {
  edsig_assert(EVP_DigestUpdate(ctx, data.data, data.size) > 0);
  return *this;
}

buf_t hash_t::final() {
  buf_t out(alg.size);
  edsig_assert(EVP_DigestFinal_ex(ctx, out.data(), nullptr) > 0);
  return out;
}

// ----------------------------------------- hmac_t ----------------------------------------

hmac_t::hmac_t(hash_e type, mem_t key) : alg(hash_alg_t::get(type)) {
  edsig_assert(alg.valid());

  scoped_ptr_t<EVP_MAC> mac(EVP_MAC_fetch(nullptr, "HMAC", nullptr));
  edsig_assert(mac.valid());
  ctx = scoped_ptr_t<EVP_MAC_CTX>(EVP_MAC_CTX_new(mac));
  edsig_assert(ctx.valid());

  OSSL_PARAM params[] = {
      OSSL_PARAM_construct_utf8_string("digest", const_cast<char*>(alg.name), 0),
      OSSL_PARAM_construct_end(),
  };
  edsig_assert(EVP_MAC_init(ctx, key.data, key.size, params) > 0);
}

hmac_t& hmac_t::update(mem_t data) {
  edsig_assert(EVP_MAC_update(ctx, data.data, data.size) > 0);
  return *this;
}

buf_t hmac_t::final() {
  buf_t out(alg.size);
  size_t written = 0;
  edsig_assert(EVP_MAC_final(ctx, out.data(), &written, out.size()) > 0 && int(written) == alg.size);
  ctx.free();
  return out;
}

}  // namespace edsig::crypto
