#include "buf.h"

#include <edsig/core/strext.h>

namespace edsig {

static void wipe(byte_ptr ptr, int n) {
  volatile byte_t* p = ptr;
  while (n--) *p++ = 0;
}

// ----------------------- mem_t ------------------

void mem_t::reverse() { std::reverse(data, data + size); }

buf_t mem_t::rev() const {
  buf_t out(size);
  std::reverse_copy(data, data + size, out.data());
  return out;
}

bool mem_t::operator==(mem_t other) const {
  // Not constant-time
  if (size != other.size) return false;
  return size == 0 || 0 == memcmp(data, other.data, size);
}

// ----------------------- buf_t ------------------

buf_t::buf_t(int n) {  // NOLINT(*init*)
  edsig_assert(n >= 0);
  if (n > inline_size) heap = new byte_t[n];
  len = n;
}

buf_t::buf_t(const_byte_ptr src, int n) : buf_t(n) {
  if (n) memmove(data(), src, n);
}

void buf_t::take_from(buf_t& src) {
  len = src.len;
  if (src.heap) {
    heap = src.heap;
    src.heap = nullptr;
    src.len = 0;
  } else {
    memmove(local, src.local, len);
    src.free();
  }
}

void buf_t::free() {
  secure_bzero();
  delete[] heap;
  heap = nullptr;
  len = 0;
}

void buf_t::secure_bzero() { wipe(data(), len); }

buf_t& buf_t::operator=(buf_t&& src) noexcept(true) {
  if (this != &src) {
    free();
    take_from(src);
  }
  return *this;
}

buf_t& buf_t::operator=(const buf_t& src) {
  if (this != &src) *this = buf_t(src);
  return *this;
}

buf_t& buf_t::operator=(mem_t src) {
  // src may alias this buffer, so copy first
  buf_t copy(src);
  return *this = std::move(copy);
}

byte_ptr buf_t::resize(int n) {
  if (n == len) return data();
  buf_t out(n);
  memmove(out.data(), data(), std::min(len, n));
  *this = std::move(out);
  return data();
}

buf_t& buf_t::operator+=(mem_t src) { return *this = mem_t(*this) + src; }

buf_t operator+(mem_t a, mem_t b) {
  buf_t out(a.size + b.size);
  if (a.size) memmove(out.data(), a.data, a.size);
  if (b.size) memmove(out.data() + a.size, b.data, b.size);
  return out;
}

}  // namespace edsig

std::ostream& operator<<(std::ostream& os, mem_t mem) { return os << strext::to_hex(mem); }
