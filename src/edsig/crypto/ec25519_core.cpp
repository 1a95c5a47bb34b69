#include "ec25519_core.h"

namespace edsig::crypto::ec25519_core {

using namespace ed25519;

point_t identity() { return point_t{bn_t(0), bn_t(1)}; }

const point_t& get_generator() {
  static const point_t g = point_t{base_x(), base_y()};
  return g;
}

point_t add(const point_t& a, const point_t& b) {
  const mod_t& q = p();
  bn_t xx = q.mul(a.x, b.x);
  bn_t yy = q.mul(a.y, b.y);
  bn_t t = q.mul(d(), q.mul(xx, yy));

  point_t r;
  r.x = q.mul(q.add(q.mul(a.x, b.y), q.mul(b.x, a.y)), inv(q.add(bn_t(1), t)));
  r.y = q.mul(q.add(yy, xx), inv(q.sub(bn_t(1), t)));
  return r;
}

// Double-and-add from the most significant bit, so any non-negative e works, reduced or not.
point_t mul(const point_t& a, const bn_t& e) {
  edsig_assert(e.sign() >= 0);

  point_t r = identity();
  for (int i = e.get_bits_count() - 1; i >= 0; i--) {
    r = add(r, r);
    if (e.is_bit_set(i)) r = add(r, a);
  }
  return r;
}

bool is_on_curve(const point_t& a) {
  const mod_t& q = p();
  bn_t xx = q.mul(a.x, a.x);
  bn_t yy = q.mul(a.y, a.y);
  bn_t lhs = q.sub(yy, xx);
  bn_t rhs = q.add(bn_t(1), q.mul(d(), q.mul(xx, yy)));
  return lhs == rhs;
}

bn_t xrecover(const bn_t& y) {
  const mod_t& q = p();
  bn_t yy = q.mul(y, y);
  bn_t xx = q.mul(q.sub(yy, bn_t(1)), inv(q.add(q.mul(d(), yy), bn_t(1))));

  static const bn_t root_exp = (q.value() + 3) / 8;
  bn_t x = expmod(xx, root_exp, q);
  if (!q.sub(q.mul(x, x), xx).is_zero()) x = q.mul(x, sqrt_m1());
  if (x.is_odd()) x = q.value() - x;
  return x;
}

void to_bin(const point_t& a, byte_ptr out) {
  buf_t bin = to_le(a.y, point_bin_size);
  if (a.x.is_odd()) bin[point_bin_size - 1] |= 0x80;
  memmove(out, bin.data(), point_bin_size);
}

buf_t to_bin(const point_t& a) {
  buf_t out(point_bin_size);
  to_bin(a, out.data());
  return out;
}

error_t from_bin(point_t& r, mem_t bin) {
  if (bin.size != point_bin_size) {
    return edsig::error(E_FORMAT, "point encoding must be 32 bytes, got " + strext::itoa(bin.size));
  }

  buf_t le = bin;
  bool xc = (le[point_bin_size - 1] >> 7) != 0;
  le[point_bin_size - 1] &= 0x7f;

  const mod_t& q = p();
  bn_t y = q.mod(from_le(le));
  bn_t x = xrecover(y);
  if (x.is_odd() != xc) x = q.neg(x);

  point_t candidate{x, y};
  if (!is_on_curve(candidate)) return edsig::error(E_INVALID_POINT, "point is not on curve");

  r = candidate;
  return SUCCESS;
}

}  // namespace edsig::crypto::ec25519_core
