#include <gtest/gtest.h>

#include <edsig/core/log.h>
#include <edsig/crypto/ec25519_core.h>

#include "utils/test_macros.h"

using namespace edsig;
using namespace edsig::crypto;
using namespace edsig::crypto::ec25519_core;

namespace {

buf_t hex(const std::string& s) {
  buf_t out;
  EXPECT_TRUE(strext::from_hex(out, s));
  return out;
}

TEST(Ec25519Core, Generator) {
  const point_t& G = get_generator();
  EXPECT_TRUE(is_on_curve(G));
  EXPECT_EQ(strext::to_hex(to_bin(G)), "5866666666666666666666666666666666666666666666666666666666666666");
  EXPECT_EQ(xrecover(G.y), G.x);
}

TEST(Ec25519Core, Identity) {
  const point_t& G = get_generator();
  point_t O = identity();
  EXPECT_TRUE(is_on_curve(O));
  EXPECT_EQ(add(G, O), G);
  EXPECT_EQ(add(O, G), G);
  EXPECT_EQ(mul(G, bn_t(0)), O);
  EXPECT_EQ(mul(G, bn_t(1)), G);

  // l * G wraps around
  EXPECT_EQ(mul(G, ed25519::order().value()), O);
  EXPECT_EQ(mul(G, ed25519::order().value() + 1), G);
}

TEST(Ec25519Core, AddAndMul) {
  const point_t& G = get_generator();
  point_t G2 = add(G, G);
  EXPECT_TRUE(is_on_curve(G2));
  EXPECT_EQ(strext::to_hex(to_bin(G2)), "c9a3f86aae465f0e56513864510f3997561fa2c9e85ea21dc2292309f3cd6022");
  EXPECT_EQ(mul(G, bn_t(2)), G2);
  EXPECT_EQ(mul(G, bn_t(5)), add(G2, add(G2, G)));

  bn_t a = bn_t::from_string("1234567890123456789012345678901234567890");
  bn_t b = bn_t::from_string("9876543210987654321");
  EXPECT_EQ(add(mul(G, a), mul(G, b)), mul(G, a + b));
  EXPECT_EQ(mul(mul(G, a), b), mul(G, a * b));

  EXPECT_EDSIG_ASSERT(mul(G, bn_t(-1)), "e.sign() >= 0");
}

TEST(Ec25519Core, UnreducedScalar) {
  // Scalars wider than 256 bits are used as is
  const point_t& G = get_generator();
  bn_t e = (bn_t(1) << 511) + 12345;
  point_t P = mul(G, e);
  EXPECT_TRUE(is_on_curve(P));
  EXPECT_EQ(P, mul(G, e % ed25519::order()));
}

TEST(Ec25519Core, EncodeDecode) {
  const point_t& G = get_generator();
  for (int i = 1; i < 20; i++) {
    point_t P = mul(G, bn_t(i * 7919));
    buf_t bin = to_bin(P);
    ASSERT_EQ(bin.size(), 32);

    point_t Q;
    ASSERT_OK(from_bin(Q, bin));
    EXPECT_EQ(P, Q);
  }

  point_t O;
  ASSERT_OK(from_bin(O, to_bin(identity())));
  EXPECT_EQ(O, identity());
}

TEST(Ec25519Core, DecodeSignBit) {
  buf_t bin = to_bin(get_generator());
  bin[31] ^= 0x80;

  point_t P;
  ASSERT_OK(from_bin(P, bin));
  EXPECT_EQ(P.y, get_generator().y);
  EXPECT_EQ(P.x, ed25519::p().neg(get_generator().x));
  EXPECT_EQ(add(P, get_generator()), identity());
}

TEST(Ec25519Core, DecodeNonCanonicalY) {
  // y = p + 1 is read as y = 1
  buf_t bin = ed25519::to_le(ed25519::p().value() + 1, 32);
  point_t P;
  ASSERT_OK(from_bin(P, bin));
  EXPECT_EQ(P, identity());
}

TEST(Ec25519Core, DecodeErrors) {
  point_t P;

  EXPECT_ER_MSG(from_bin(P, hex("0102")), "point encoding must be 32 bytes, got 2");
  EXPECT_EQ(from_bin(P, mem_t()), E_FORMAT);
  EXPECT_EQ(from_bin(P, hex("00000000000000000000000000000000000000000000000000000000000000000000")), E_FORMAT);

  // y = 2 has no x on the curve
  EXPECT_ER_MSG(from_bin(P, hex("0200000000000000000000000000000000000000000000000000000000000000")),
                "point is not on curve");
  dylog_disable_scope_t no_log_err;
  EXPECT_EQ(from_bin(P, hex("0200000000000000000000000000000000000000000000000000000000000000")), E_INVALID_POINT);
}

TEST(Ec25519Core, DecodedPointsAreOnCurve) {
  dylog_disable_scope_t no_log_err;
  int decoded = 0;
  for (int i = 0; i < 64; i++) {
    buf_t bin = ed25519::to_le(bn_t(i), 32);
    point_t P;
    if (from_bin(P, bin)) continue;
    decoded++;
    EXPECT_TRUE(is_on_curve(P));
    EXPECT_EQ(to_bin(P), bin);
  }
  EXPECT_GT(decoded, 10);
  EXPECT_LT(decoded, 64);
}

}  // namespace
