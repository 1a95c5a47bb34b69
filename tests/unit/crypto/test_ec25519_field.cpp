#include <gtest/gtest.h>

#include <edsig/crypto/ec25519_field.h>

#include "utils/test_macros.h"

using namespace edsig;
using namespace edsig::crypto;
using namespace edsig::crypto::ed25519;

namespace {

buf_t hex(const std::string& s) {
  buf_t out;
  EXPECT_TRUE(strext::from_hex(out, s));
  return out;
}

TEST(Ec25519Field, Constants) {
  EXPECT_EQ(p().value(), (bn_t(1) << 255) - 19);
  EXPECT_EQ(order().value(), (bn_t(1) << 252) + bn_t::from_string("27742317777372353535851937790883648493"));
  EXPECT_EQ(d(), bn_t::from_string("37095705934669439343138083508754565189542113879843219016388785533085940283555"));
  EXPECT_EQ(sqrt_m1(),
            bn_t::from_string("19681161376707505956807079304988542015446066515923890162744021073123829784752"));
  EXPECT_EQ(base_y(),
            bn_t::from_string("46316835694926478169428394003475163141307993866256225615783033603165251855960"));
  EXPECT_EQ(base_x(),
            bn_t::from_string("15112221349535400772501151409588531511454012693041857206046113283949847762202"));

  // I^2 = -1
  EXPECT_EQ(p().mul(sqrt_m1(), sqrt_m1()), p().value() - 1);
}

TEST(Ec25519Field, ModIsCanonical) {
  EXPECT_EQ(mod(bn_t(-1), p()), p().value() - 1);
  EXPECT_EQ(mod(p().value() + 5, p()), 5);
  EXPECT_EQ(mod(bn_t(-7), bn_t(5)), 3);
  EXPECT_EQ(mod(bn_t(0), bn_t(5)), 0);
}

TEST(Ec25519Field, Expmod) {
  EXPECT_EQ(expmod(bn_t(2), bn_t(10), bn_t(1000)), 24);
  EXPECT_EQ(expmod(bn_t(7), bn_t(0), bn_t(13)), 1);
  EXPECT_EQ(expmod(bn_t(-3), bn_t(3), bn_t(100)), 73);  // -27
  EXPECT_EQ(expmod(bn_t(-3), bn_t(2), bn_t(100)), 9);

  // Fermat: a^(p-1) = 1
  EXPECT_EQ(expmod(bn_t(123456789), p().value() - 1, p()), 1);
}

TEST(Ec25519Field, Inverse) {
  bn_t x = bn_t::from_string("987654321987654321987654321");
  EXPECT_EQ(p().mul(x, inv(x)), 1);
  EXPECT_EQ(p().mul(bn_t(-2), inv(bn_t(-2))), 1);
  EXPECT_EQ(inv(bn_t(1)), 1);
}

TEST(Ec25519Field, LittleEndian) {
  buf_t bin = hex("0102");
  EXPECT_EQ(from_le(bin), 0x0201);

  buf_t le = to_le(bn_t(0x0201), 4);
  EXPECT_EQ(le, hex("01020000"));
  EXPECT_EQ(from_le(le), 0x0201);

  buf_t ones = hex("ffffffffffffffffffffffffffffffffffffffffffffffffffffffffffffffff");
  EXPECT_EQ(from_le(ones), (bn_t(1) << 256) - 1);
}

TEST(Ec25519Field, Clamp) {
  buf_t ones = hex("ffffffffffffffffffffffffffffffffffffffffffffffffffffffffffffffffaaaa");
  buf_t c = clamp(ones);
  ASSERT_EQ(c.size(), 32);
  EXPECT_EQ(c[0], 0xf8);
  EXPECT_EQ(c[31], 0x7f);
  for (int i = 1; i < 31; i++) EXPECT_EQ(c[i], 0xff);

  buf_t zeros(32);
  zeros.bzero();
  c = clamp(zeros);
  EXPECT_EQ(c[0], 0);
  EXPECT_EQ(c[31], 0x40);

  bn_t a = from_le(clamp(ones));
  EXPECT_EQ(a.get_bits_count(), 255);
  EXPECT_FALSE(a.is_bit_set(0));
  EXPECT_FALSE(a.is_bit_set(1));
  EXPECT_FALSE(a.is_bit_set(2));

  EXPECT_EDSIG_ASSERT(clamp(hex("0102")), "bin.size >= key_size");
}

}  // namespace
