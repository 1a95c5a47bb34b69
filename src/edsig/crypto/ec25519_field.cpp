#include "ec25519_field.h"

namespace edsig::crypto::ed25519 {

const mod_t& p() {
  static const mod_t p_value =
      mod_t(bn_t::from_string("57896044618658097711785492504343953926634992332820282019728792003956564819949"));
  return p_value;
}

const mod_t& order() {
  static const mod_t order_value =
      mod_t(bn_t::from_string("7237005577332262213973186563042994240857116359379907606001950938285454250989"));
  return order_value;
}

const bn_t& d() {
  static const bn_t d_value = p().mul(bn_t(-121665), inv(bn_t(121666)));
  return d_value;
}

const bn_t& sqrt_m1() {
  static const bn_t i_value = expmod(bn_t(2), (p().value() - 1) / 4, p());
  return i_value;
}

const bn_t& base_x() {
  static const bn_t x_value =
      bn_t::from_string("15112221349535400772501151409588531511454012693041857206046113283949847762202");
  return x_value;
}

const bn_t& base_y() {
  static const bn_t y_value = p().mul(bn_t(4), inv(bn_t(5)));
  return y_value;
}

bn_t mod(const bn_t& x, const bn_t& m) { return mod_t::mod(x, m); }

bn_t expmod(const bn_t& b, const bn_t& e, const bn_t& m) { return mod_t(m).pow(b, e); }

bn_t inv(const bn_t& x) { return p().inv(x); }

bn_t from_le(mem_t bin) { return bn_t::from_bin(bin.rev()); }

buf_t to_le(const bn_t& x, int size) {
  buf_t out = x.to_bin(size);
  out.reverse();
  return out;
}

// see https://www.rfc-editor.org/rfc/rfc8032#section-5.1.5
buf_t clamp(mem_t bin) {
  edsig_assert(bin.size >= key_size);
  buf_t out = bin.take(key_size);
  out[0] &= 248;
  out[31] &= 127;
  out[31] |= 64;
  return out;
}

}  // namespace edsig::crypto::ed25519
