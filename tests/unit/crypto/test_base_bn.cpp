#include <gtest/gtest.h>
#include <climits>

#include <edsig/crypto/base.h>

#include "utils/test_macros.h"

using namespace edsig;
using namespace edsig::crypto;

namespace {

struct signed_case_t {
  int a, b;
};

// Every sign combination, with zero on either side
const signed_case_t signed_cases[] = {
    {123, 456}, {-123, 456}, {123, -456}, {-123, -456}, {0, 999}, {999, 0}, {-1000, 1},
};

TEST(BigNumber, ArithmeticMatchesInt64) {
  for (const auto& c : signed_cases) {
    SCOPED_TRACE(std::to_string(c.a) + ", " + std::to_string(c.b));
    bn_t a(c.a), b(c.b);
    EXPECT_EQ(a + b, c.a + c.b);
    EXPECT_EQ(a - b, c.a - c.b);
    EXPECT_EQ(a * b, c.a * c.b);
    EXPECT_EQ(a + c.b, c.a + c.b);
    EXPECT_EQ(a * c.b, c.a * c.b);
    if (c.b != 0) EXPECT_EQ(a / b, c.a / c.b);
    EXPECT_EQ(bn_t::compare(a, b) < 0, c.a < c.b);
    EXPECT_EQ(-a, -c.a);
    EXPECT_EQ(a.abs(), c.a < 0 ? -c.a : c.a);
    EXPECT_EQ(a.sign(), (c.a > 0) - (c.a < 0));
  }
}

TEST(BigNumber, Shifts) {
  bn_t val(1);
  val <<= 10;
  EXPECT_EQ(val, 1024);
  val >>= 5;
  EXPECT_EQ(val, 32);
  EXPECT_EQ(bn_t(5) << 3, 40);
  EXPECT_EQ(bn_t(40) >> 2, 10);
  EXPECT_EQ(bn_t(1) >> 1, 0);
}

TEST(BigNumber, FromInt) {
  EXPECT_EQ(bn_t(0).sign(), 0);
  EXPECT_TRUE(bn_t(0).is_zero());
  EXPECT_EQ(bn_t(INT_MAX).to_string(), "2147483647");
  EXPECT_EQ(bn_t(INT_MIN).to_string(), "-2147483648");
  EXPECT_EQ(bn_t(-1) + bn_t(1), 0);

  bn_t assigned;
  assigned = -42;
  EXPECT_EQ(assigned.to_string(), "-42");
}

TEST(BigNumber, Bits) {
  bn_t val = bn_t(1) << 3;
  EXPECT_TRUE(val.is_bit_set(3));
  EXPECT_FALSE(val.is_bit_set(2));
  EXPECT_FALSE(val.is_bit_set(300));
  EXPECT_EQ(val.get_bits_count(), 4);
  EXPECT_FALSE(val.is_odd());
  EXPECT_TRUE((val + 1).is_odd());
}

TEST(BigNumber, GetBinSize) {
  EXPECT_EQ(bn_t(0).get_bin_size(), 0);
  EXPECT_EQ(bn_t(1).get_bin_size(), 1);
  EXPECT_EQ(bn_t(127).get_bin_size(), 1);
  EXPECT_EQ(bn_t(255).get_bin_size(), 1);
  EXPECT_EQ(bn_t(256).get_bin_size(), 2);
  EXPECT_EQ(bn_t(65535).get_bin_size(), 2);
  EXPECT_EQ(bn_t(65536).get_bin_size(), 3);

  EXPECT_EQ(bn_t(-1).get_bin_size(), 1);
  EXPECT_EQ(bn_t(-255).get_bin_size(), 1);
  EXPECT_EQ(bn_t(-256).get_bin_size(), 2);
}

TEST(BigNumber, BinaryAndText) {
  bn_t a = bn_t::from_string("340282366920938463463374607431768211457");  // 2^128 + 1
  EXPECT_EQ(a, (bn_t(1) << 128) + 1);
  EXPECT_EQ(a.to_string(), "340282366920938463463374607431768211457");
  EXPECT_EQ(a.get_bits_count(), 129);

  buf_t bin = a.to_bin();
  EXPECT_EQ(bin.size(), 17);
  EXPECT_EQ(bin[0], 1);
  EXPECT_EQ(bin[16], 1);
  EXPECT_EQ(bn_t::from_bin(bin), a);

  buf_t padded = bn_t(258).to_bin(4);
  EXPECT_EQ(padded.size(), 4);
  EXPECT_EQ(padded[2], 1);
  EXPECT_EQ(padded[3], 2);

  EXPECT_EDSIG_ASSERT(bn_t(65536).to_bin(2), "size >= get_bin_size()");
}

TEST(BigNumber, CopyAndMove) {
  bn_t a = bn_t::from_string("123456789012345678901234567890");
  bn_t b = a;
  b += 1;
  EXPECT_EQ(a + 1, b);

  bn_t c = std::move(b);
  EXPECT_EQ(c, a + 1);

  bn_t empty;
  EXPECT_EQ(empty, 0);
}

TEST(BigNumber, Compare) {
  EXPECT_LT(bn_t(-5), bn_t(3));
  EXPECT_GT(bn_t(5), 3);
  EXPECT_EQ(bn_t::compare(bn_t(7), bn_t(7)), 0);
  EXPECT_EQ(bn_t(-7).sign(), -1);
  EXPECT_TRUE(bn_t(7).is_odd());
}

TEST(Modulo, CanonicalRepresentative) {
  mod_t m13(13);
  EXPECT_EQ(m13.mod(bn_t(-1)), 12);
  EXPECT_EQ(m13.mod(bn_t(-27)), 12);
  EXPECT_EQ(m13.mod(bn_t(27)), 1);
  EXPECT_EQ(mod_t::mod(bn_t(-13), bn_t(13)), 0);
  EXPECT_EQ(bn_t(-40) % m13, 12);

  EXPECT_EQ(m13.add(bn_t(10), bn_t(5)), 2);
  EXPECT_EQ(m13.sub(bn_t(3), bn_t(5)), 11);
  EXPECT_EQ(m13.neg(bn_t(1)), 12);
  EXPECT_EQ(m13.neg(bn_t(0)), 0);
  EXPECT_EQ(m13.mul(bn_t(-2), bn_t(7)), 12);
}

TEST(Modulo, Pow) {
  mod_t m13(13);
  // 3^5 = 243 = 18*13 + 9
  EXPECT_EQ(m13.pow(bn_t(3), bn_t(5)), 9);
  EXPECT_EQ(m13.pow(bn_t(3), bn_t(0)), 1);
  EXPECT_EQ(m13.pow(bn_t(0), bn_t(5)), 0);
  EXPECT_EQ(m13.pow(bn_t(-2), bn_t(3)), 5);  // -8
  EXPECT_EQ(m13.pow(bn_t(-2), bn_t(2)), 4);
  EXPECT_EQ(m13.pow(bn_t(-13), bn_t(3)), 0);

  EXPECT_EDSIG_ASSERT(m13.pow(bn_t(2), bn_t(-1)), "e.sign() >= 0");
}

TEST(Modulo, Inverse) {
  mod_t m13(13);
  for (int a = 1; a < 13; a++) EXPECT_EQ(m13.mul(bn_t(a), m13.inv(bn_t(a))), 1);
  EXPECT_EQ(m13.mul(bn_t(6), m13.inv(bn_t(3))), 2);
  EXPECT_EQ(m13.inv(bn_t(-1)), 12);
  EXPECT_EQ(m13.inv(bn_t(0)), 0);
}

TEST(Modulo, ModulusMustBePositive) {
  EXPECT_EDSIG_ASSERT(mod_t(bn_t(0)), "m > 0");
  EXPECT_EDSIG_ASSERT(mod_t(bn_t(-7)), "m > 0");
}

}  // namespace
