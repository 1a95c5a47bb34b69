#pragma once

namespace edsig::crypto {

class mod_t;

// Signed big integer with value semantics over an OpenSSL BIGNUM. The BIGNUM is allocated lazily
// and cleared on destruction. OpenSSL failures are treated as assertion failures.
class bn_t {
 public:
  bn_t() {}
  bn_t(int value);
  bn_t(const BIGNUM* src);
  bn_t(const bn_t& src) : bn_t(src.val) {}
  bn_t(bn_t&& src) noexcept(true) : val(src.val) { src.val = nullptr; }
  ~bn_t() { BN_clear_free(val); }

  bn_t& operator=(const bn_t& src);
  bn_t& operator=(bn_t&& src) noexcept(true);

  operator const BIGNUM*() const { return get(); }
  operator BIGNUM*() { return get(); }

  // The int overloads keep comparisons against literals from competing with the BIGNUM* conversions
  bool operator==(const bn_t& v) const { return compare(*this, v) == 0; }
  bool operator!=(const bn_t& v) const { return compare(*this, v) != 0; }
  bool operator<(const bn_t& v) const { return compare(*this, v) < 0; }
  bool operator>(const bn_t& v) const { return compare(*this, v) > 0; }
  bool operator<=(const bn_t& v) const { return compare(*this, v) <= 0; }
  bool operator>=(const bn_t& v) const { return compare(*this, v) >= 0; }
  bool operator==(int v) const { return *this == bn_t(v); }
  bool operator!=(int v) const { return *this != bn_t(v); }
  bool operator<(int v) const { return *this < bn_t(v); }
  bool operator>(int v) const { return *this > bn_t(v); }
  bool operator<=(int v) const { return *this <= bn_t(v); }
  bool operator>=(int v) const { return *this >= bn_t(v); }

  bn_t& operator+=(const bn_t& v);
  bn_t& operator+=(int v) { return *this += bn_t(v); }
  bn_t& operator<<=(int n);
  bn_t& operator>>=(int n);

  bn_t neg() const;
  bn_t abs() const { return sign() < 0 ? neg() : *this; }
  int sign() const;
  bool is_odd() const { return BN_is_odd(get()) != 0; }
  bool is_zero() const { return BN_is_zero(get()) != 0; }

  bool is_bit_set(int n) const { return BN_is_bit_set(get(), n) != 0; }
  int get_bin_size() const { return BN_num_bytes(get()); }
  int get_bits_count() const { return BN_num_bits(get()); }

  // Big-endian magnitude; the sign is dropped
  buf_t to_bin() const { return to_bin(get_bin_size()); }
  buf_t to_bin(int size) const;
  void to_bin(byte_ptr dst, int size) const;
  static bn_t from_bin(mem_t mem);

  std::string to_string() const;
  static bn_t from_string(const_char_ptr str);
  static bn_t from_string(const std::string& str) { return from_string(str.c_str()); }

  static int compare(const bn_t& a, const bn_t& b) { return BN_cmp(a, b); }

  // Scratch context shared by all big integer operations on the calling thread
  static BN_CTX* thread_local_storage_bn_ctx();

 private:
  mutable BIGNUM* val = nullptr;
  BIGNUM* get() const;
};

bn_t operator+(const bn_t& a, const bn_t& b);
bn_t operator-(const bn_t& a, const bn_t& b);
bn_t operator*(const bn_t& a, const bn_t& b);
bn_t operator/(const bn_t& a, const bn_t& b);
bn_t operator%(const bn_t& a, const mod_t& m);
bn_t operator-(const bn_t& a);

inline bn_t operator+(const bn_t& a, int b) { return a + bn_t(b); }
inline bn_t operator-(const bn_t& a, int b) { return a - bn_t(b); }
inline bn_t operator*(const bn_t& a, int b) { return a * bn_t(b); }
inline bn_t operator/(const bn_t& a, int b) { return a / bn_t(b); }

bn_t operator<<(const bn_t& a, int n);
bn_t operator>>(const bn_t& a, int n);

std::ostream& operator<<(std::ostream& os, const bn_t& v);

}  // namespace edsig::crypto
