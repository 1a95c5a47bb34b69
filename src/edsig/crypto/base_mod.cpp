#include <edsig/crypto/base.h>

namespace edsig::crypto {

mod_t::mod_t(const bn_t& _m) : m(_m) { edsig_assert(m > 0); }

bn_t mod_t::mod(const bn_t& a, const bn_t& m) {  // static
  return mod_t(m).mod(a);
}

void mod_t::_mod(bn_t& r, const bn_t& a) const {
  int res = BN_nnmod(r, a, m, bn_t::thread_local_storage_bn_ctx());
  edsig_assert(res);
}

void mod_t::_add(bn_t& r, const bn_t& a, const bn_t& b) const {
  int res = BN_mod_add(r, a, b, m, bn_t::thread_local_storage_bn_ctx());
  edsig_assert(res);
}

void mod_t::_sub(bn_t& r, const bn_t& a, const bn_t& b) const {
  int res = BN_mod_sub(r, a, b, m, bn_t::thread_local_storage_bn_ctx());
  edsig_assert(res);
}

void mod_t::_mul(bn_t& r, const bn_t& a, const bn_t& b) const {
  int res = BN_mod_mul(r, a, b, m, bn_t::thread_local_storage_bn_ctx());
  edsig_assert(res);
}

// A negative base is raised in absolute value and the sign restored afterwards:
// for odd e a nonzero result r becomes m - r.
void mod_t::_pow(bn_t& r, const bn_t& x, const bn_t& e) const {
  edsig_assert(e.sign() >= 0);

  bn_t base = mod(x.abs());
  int res = BN_mod_exp(r, base, e, m, bn_t::thread_local_storage_bn_ctx());
  edsig_assert(res);

  if (x.sign() < 0 && e.is_odd() && !r.is_zero()) r = m - r;
}

bn_t mod_t::inv(const bn_t& a) const { return pow(a, m - 2); }

}  // namespace edsig::crypto
