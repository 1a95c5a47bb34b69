#pragma once

#include <edsig/core/precompiled.h>

namespace edsig::crypto {

// Move-only owner of an OpenSSL handle. release() is specialized per handle type in base.cpp.
template <typename T>
class scoped_ptr_t {
 public:
  scoped_ptr_t() {}
  explicit scoped_ptr_t(T* p) : ptr(p) {}
  scoped_ptr_t(scoped_ptr_t&& src) noexcept(true) : ptr(src.ptr) { src.ptr = nullptr; }
  scoped_ptr_t(const scoped_ptr_t&) = delete;
  ~scoped_ptr_t() { free(); }

  scoped_ptr_t& operator=(scoped_ptr_t&& src) noexcept(true) {
    std::swap(ptr, src.ptr);
    return *this;
  }
  scoped_ptr_t& operator=(const scoped_ptr_t&) = delete;

  void free() {
    if (ptr) release(ptr);
    ptr = nullptr;
  }

  operator T*() const { return ptr; }
  bool operator!() const { return !ptr; }
  bool valid() const { return ptr != nullptr; }

 private:
  T* ptr = nullptr;
  static void release(T* p);
};

template <>
void scoped_ptr_t<EVP_MD_CTX>::release(EVP_MD_CTX* p);
template <>
void scoped_ptr_t<EVP_MAC_CTX>::release(EVP_MAC_CTX* p);
template <>
void scoped_ptr_t<EVP_MAC>::release(EVP_MAC* p);

}  // namespace edsig::crypto
