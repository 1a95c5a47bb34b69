#include "ec25519_montgomery.h"

namespace edsig::crypto::ed25519 {

buf_t montgomery_u(const ec25519_core::point_t& a) {
  const mod_t& q = p();
  bn_t u = q.mul(q.add(bn_t(1), a.y), inv(q.sub(bn_t(1), a.y)));
  return to_le(u, key_size);
}

error_t to_curve25519(const hash_fn_t& hash, mem_t key, key_kind_e which, buf_t& out) {
  error_t rv = UNINITIALIZED_ERROR;

  switch (which) {
    case key_kind_e::public_key: {
      ec25519_core::point_t A;
      if (rv = ec25519_core::from_bin(A, key)) return rv;
      out = montgomery_u(A);
      return SUCCESS;
    }
    case key_kind_e::secret_key:
      out = clamp(hash(key));
      return SUCCESS;
  }

  return edsig::error(E_BADARG, "unsupported key kind " + strext::itoa(int(which)));
}

}  // namespace edsig::crypto::ed25519
