#include <edsig/core/buf.h>
#include <edsig/core/macros.h>
#include <edsig/core/strext.h>

static int hex_digit(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

std::string strext::to_lower(std::string str) {
  for (char& c : str) c = char(::tolower((unsigned char)c));
  return str;
}

void strext::trim(std::string& str) {
  auto blank = [](char c) { return (unsigned char)c <= ' '; };
  auto end = std::find_if_not(str.rbegin(), str.rend(), blank).base();
  auto begin = std::find_if_not(str.begin(), end, blank);
  str = std::string(begin, end);
}

std::string strext::to_hex(mem_t mem) {
  static const char digits[] = "0123456789abcdef";
  std::string out;
  out.reserve(mem.size * 2);
  for (int i = 0; i < mem.size; i++) {
    out += digits[mem[i] >> 4];
    out += digits[mem[i] & 15];
  }
  return out;
}

bool strext::from_hex(buf_t& dst, const std::string& src) {
  if (src.length() & 1) return false;
  buf_t out(int(src.length() / 2));
  for (int i = 0; i < out.size(); i++) {
    int hi = hex_digit(src[2 * i]);
    int lo = hex_digit(src[2 * i + 1]);
    if (hi < 0 || lo < 0) return false;
    out[i] = byte_t((hi << 4) | lo);
  }
  dst = std::move(out);
  return true;
}
