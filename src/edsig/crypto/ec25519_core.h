#pragma once

#include <edsig/crypto/ec25519_field.h>

namespace edsig::crypto::ec25519_core {

// Affine point (x, y) on -x^2 + y^2 = 1 + d*x^2*y^2 with canonical coordinates.
struct point_t {
  bn_t x, y;

  bool operator==(const point_t& other) const { return x == other.x && y == other.y; }
  bool operator!=(const point_t& other) const { return !(*this == other); }
};

point_t identity();
const point_t& get_generator();

point_t add(const point_t& a, const point_t& b);
point_t mul(const point_t& a, const bn_t& e);
bool is_on_curve(const point_t& a);

// Even root x of x^2 = (y^2 - 1) / (d*y^2 + 1)
bn_t xrecover(const bn_t& y);

buf_t to_bin(const point_t& a);
void to_bin(const point_t& a, byte_ptr out);

/**
 * Decodes a compressed point.
 * Returns E_FORMAT if bin is not 32 bytes and E_INVALID_POINT if the recovered point is not on the curve.
 */
error_t from_bin(point_t& r, mem_t bin);

}  // namespace edsig::crypto::ec25519_core
