#pragma once

#include <edsig/crypto/base.h>

namespace edsig::crypto::ed25519 {

enum {
  key_size = 32,
  signature_size = 64,
  point_bin_size = 32,
  bits = 256,
};

const mod_t& p();      // 2^255 - 19
const mod_t& order();  // l = 2^252 + 27742317777372353535851937790883648493
const bn_t& d();       // -121665/121666 mod p
const bn_t& sqrt_m1();  // 2^((p-1)/4) mod p
const bn_t& base_x();
const bn_t& base_y();

// Canonical representative of x in [0, m) for any signed x.
bn_t mod(const bn_t& x, const bn_t& m);

// b^e mod m for e >= 0; a negative b is handled as -(|b|^e) when e is odd.
bn_t expmod(const bn_t& b, const bn_t& e, const bn_t& m);

// Inverse modulo p by Fermat's little theorem. x = 0 (mod p) is an unchecked precondition.
bn_t inv(const bn_t& x);

bn_t from_le(mem_t bin);
buf_t to_le(const bn_t& x, int size);

// Clears bits 0-2 and 255 and sets bit 254 of a little-endian 32-byte string.
buf_t clamp(mem_t bin);

}  // namespace edsig::crypto::ed25519
