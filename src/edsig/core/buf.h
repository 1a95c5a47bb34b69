#pragma once
#include <edsig/core/error.h>
#include <edsig/core/macros.h>

namespace edsig {

class buf_t;

// Non-owning view over a byte range. Keys, digests, encodings and messages all travel as mem_t.
struct mem_t {
  byte_ptr data = nullptr;
  int size = 0;

  mem_t() noexcept(true) {}
  mem_t(const_byte_ptr ptr, int n) noexcept(true) : data(byte_ptr(ptr)), size(n) {}
  mem_t(const std::string& s) noexcept(true) : data(byte_ptr(s.data())), size(int(s.size())) {}

  // Zero-terminated text; binary arrays must pass their size explicitly
  explicit mem_t(const char* str) : data(byte_ptr(str)), size(int(strlen(str))) {}

  uint8_t operator[](int index) const { return data[index]; }
  uint8_t& operator[](int index) { return data[index]; }

  mem_t range(int offset, int n) const { return mem_t(data + offset, n); }
  mem_t skip(int offset) const { return range(offset, size - offset); }
  mem_t take(int n) const { return range(0, n); }

  // In-place byte order swap; rev() returns a reversed copy
  void reverse();
  buf_t rev() const;

  bool operator==(mem_t other) const;
  bool operator!=(mem_t other) const { return !(*this == other); }

  std::string to_string() const { return std::string(const_char_ptr(data), size); }
};

// Owning byte string. Contents up to inline_size bytes avoid the heap. Storage is wiped on release.
class buf_t {
 public:
  buf_t() noexcept(true) {}
  explicit buf_t(int n);
  buf_t(const_byte_ptr src, int n);
  buf_t(mem_t mem) : buf_t(mem.data, mem.size) {}
  buf_t(const buf_t& src) : buf_t(src.data(), src.len) {}
  buf_t(buf_t&& src) noexcept(true) { take_from(src); }
  ~buf_t() { free(); }

  buf_t& operator=(const buf_t& src);
  buf_t& operator=(buf_t&& src) noexcept(true);
  buf_t& operator=(mem_t src);

  byte_ptr data() const { return heap ? heap : const_cast<byte_ptr>(local); }
  int size() const { return len; }
  bool empty() const { return len == 0; }

  void free();
  byte_ptr resize(int n);
  void bzero() { memset(data(), 0, len); }
  void secure_bzero();

  void reverse() { mem_t(*this).reverse(); }
  buf_t rev() const { return mem_t(*this).rev(); }

  buf_t& operator+=(mem_t src);
  bool operator==(const buf_t& other) const { return mem_t(*this) == mem_t(other); }
  bool operator!=(const buf_t& other) const { return !(*this == other); }

  uint8_t operator[](int index) const { return data()[index]; }
  uint8_t& operator[](int index) { return data()[index]; }

  operator mem_t() const { return mem_t(data(), len); }

  mem_t range(int offset, int n) const { return mem_t(*this).range(offset, n); }
  mem_t skip(int offset) const { return mem_t(*this).skip(offset); }
  mem_t take(int n) const { return mem_t(*this).take(n); }

  std::string to_string() const { return mem_t(*this).to_string(); }

 private:
  enum { inline_size = 64 };

  byte_t local[inline_size];
  byte_ptr heap = nullptr;
  int len = 0;

  void take_from(buf_t& src);
};

buf_t operator+(mem_t a, mem_t b);

}  // namespace edsig

using edsig::buf_t;
using edsig::mem_t;

std::ostream& operator<<(std::ostream& os, mem_t mem);
