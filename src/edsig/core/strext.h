#pragma once

#include <edsig/core/buf.h>

// String helpers shared by the hash configuration, the error paths and the tests.
struct strext {
  static mem_t mem(const std::string& s) { return mem_t(s); }
  static std::string from_char_ptr(const_char_ptr ptr) { return ptr ? std::string(ptr) : std::string(); }
  static std::string itoa(int value) { return std::to_string(value); }

  static std::string to_lower(std::string str);
  static void trim(std::string& str);
  static bool starts_with(const std::string& str, const std::string& prefix) {
    return str.compare(0, prefix.length(), prefix) == 0;
  }

  // Lowercase hex, two digits per byte
  static std::string to_hex(mem_t mem);
  // Accepts either case; leaves dst untouched on odd length or a bad digit
  static bool from_hex(buf_t& dst, const std::string& src);
};
