#include <edsig/crypto/base.h>

namespace edsig::crypto {

static thread_local BN_CTX* tls_bn_ctx = nullptr;

BN_CTX* bn_t::thread_local_storage_bn_ctx() {  // static
  if (!tls_bn_ctx) {
    tls_bn_ctx = BN_CTX_new();
    edsig_assert(tls_bn_ctx);
  }
  return tls_bn_ctx;
}

static BN_CTX* ctx() { return bn_t::thread_local_storage_bn_ctx(); }

BIGNUM* bn_t::get() const {
  if (!val) {
    val = BN_new();
    if (!val) throw std::bad_alloc();
  }
  return val;
}

bn_t::bn_t(int value) {
  edsig_assert(BN_set_word(get(), static_cast<BN_ULONG>(value < 0 ? -int64_t(value) : int64_t(value))));
  if (value < 0) BN_set_negative(val, 1);
}

bn_t::bn_t(const BIGNUM* src) {
  if (src) edsig_assert(BN_copy(get(), src));
}

bn_t& bn_t::operator=(const bn_t& src) {
  if (this != &src) edsig_assert(BN_copy(get(), src));
  return *this;
}

bn_t& bn_t::operator=(bn_t&& src) noexcept(true) {
  std::swap(val, src.val);
  return *this;
}

bn_t& bn_t::operator+=(const bn_t& v) {
  edsig_assert(BN_add(get(), get(), v));
  return *this;
}

bn_t& bn_t::operator<<=(int n) {
  edsig_assert(BN_lshift(get(), get(), n));
  return *this;
}

bn_t& bn_t::operator>>=(int n) {
  edsig_assert(BN_rshift(get(), get(), n));
  return *this;
}

bn_t bn_t::neg() const {
  bn_t r = *this;
  if (!r.is_zero()) BN_set_negative(r, !BN_is_negative(r.get()));
  return r;
}

int bn_t::sign() const {
  if (is_zero()) return 0;
  return BN_is_negative(get()) ? -1 : 1;
}

void bn_t::to_bin(byte_ptr dst, int size) const {
  edsig_assert(size >= get_bin_size());
  BN_bn2binpad(get(), dst, size);
}

buf_t bn_t::to_bin(int size) const {
  buf_t out(size);
  to_bin(out.data(), size);
  return out;
}

bn_t bn_t::from_bin(mem_t mem) {  // static
  bn_t r;
  edsig_assert(BN_bin2bn(mem.data, mem.size, r));
  return r;
}

std::string bn_t::to_string() const {
  char* s = BN_bn2dec(get());
  if (!s) throw std::bad_alloc();
  std::string out(s);
  OPENSSL_free(s);
  return out;
}

bn_t bn_t::from_string(const_char_ptr str) {  // static
  bn_t r;
  BIGNUM* ptr = r;
  edsig_assert(BN_dec2bn(&ptr, str));
  return r;
}

bn_t operator+(const bn_t& a, const bn_t& b) {
  bn_t r;
  edsig_assert(BN_add(r, a, b));
  return r;
}

bn_t operator-(const bn_t& a, const bn_t& b) {
  bn_t r;
  edsig_assert(BN_sub(r, a, b));
  return r;
}

bn_t operator*(const bn_t& a, const bn_t& b) {
  bn_t r;
  edsig_assert(BN_mul(r, a, b, ctx()));
  return r;
}

// Truncates toward zero
bn_t operator/(const bn_t& a, const bn_t& b) {
  bn_t r;
  edsig_assert(BN_div(r, nullptr, a, b, ctx()));
  return r;
}

bn_t operator%(const bn_t& a, const mod_t& m) { return m.mod(a); }

bn_t operator-(const bn_t& a) { return a.neg(); }

bn_t operator<<(const bn_t& a, int n) {
  bn_t r = a;
  return r <<= n;
}

bn_t operator>>(const bn_t& a, int n) {
  bn_t r = a;
  return r >>= n;
}

std::ostream& operator<<(std::ostream& os, const bn_t& v) { return os << v.to_string(); }

}  // namespace edsig::crypto
