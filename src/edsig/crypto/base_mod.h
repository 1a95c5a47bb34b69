#pragma once

namespace edsig::crypto {

// Arithmetic modulo a fixed positive m. Every result is the canonical representative in [0, m),
// inputs may be any signed integer. Nothing here runs in constant time.
class mod_t {
 public:
  mod_t(const bn_t& m);

  // clang-format off
  bn_t add(const bn_t& a, const bn_t& b) const { bn_t r; _add(r, a, b); return r; }
  bn_t sub(const bn_t& a, const bn_t& b) const { bn_t r; _sub(r, a, b); return r; }
  bn_t neg(const bn_t& a) const                { return sub(bn_t(0), a); }
  bn_t mul(const bn_t& a, const bn_t& b) const { bn_t r; _mul(r, a, b); return r; }
  bn_t pow(const bn_t& x, const bn_t& e) const { bn_t r; _pow(r, x, e); return r; }
  bn_t mod(const bn_t& a) const                { bn_t r; _mod(r, a);    return r; }
  // clang-format on

  /**
   * Fermat inverse x^(m-2), so m must be prime.
   * x = 0 (mod m) is not detected and yields 0.
   */
  bn_t inv(const bn_t& a) const;

  static bn_t mod(const bn_t& a, const bn_t& m);

  operator const bn_t&() const { return m; }
  const bn_t& value() const { return m; }

 private:
  bn_t m;

  void _add(bn_t& r, const bn_t& a, const bn_t& b) const;
  void _sub(bn_t& r, const bn_t& a, const bn_t& b) const;
  void _mul(bn_t& r, const bn_t& a, const bn_t& b) const;
  void _pow(bn_t& r, const bn_t& x, const bn_t& e) const;
  void _mod(bn_t& r, const bn_t& a) const;
};

}  // namespace edsig::crypto
