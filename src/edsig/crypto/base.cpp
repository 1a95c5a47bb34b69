#include "base.h"

#include "scope.h"

namespace edsig::crypto {

template <>
void scoped_ptr_t<EVP_MD_CTX>::release(EVP_MD_CTX* p) {
  EVP_MD_CTX_free(p);
}
template <>
void scoped_ptr_t<EVP_MAC_CTX>::release(EVP_MAC_CTX* p) {
  EVP_MAC_CTX_free(p);
}
template <>
void scoped_ptr_t<EVP_MAC>::release(EVP_MAC* p) {
  EVP_MAC_free(p);
}

void gen_random(byte_ptr output, int size) {
  int res = RAND_bytes(output, size);
  edsig_assert(res > 0);
}

buf_t gen_random(int size) {
  buf_t output(size);
  gen_random(output.data(), size);
  return output;
}

}  // namespace edsig::crypto
