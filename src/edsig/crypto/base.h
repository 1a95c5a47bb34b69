#pragma once

#include <edsig/core/buf.h>
#include <edsig/core/error.h>
#include <edsig/core/strext.h>

enum {
  E_INVALID_POINT = ERRCODE(ECATEGORY_CRYPTO, 2),
};

namespace edsig::crypto {
class bn_t;
class mod_t;

void gen_random(byte_ptr output, int size);
buf_t gen_random(int size);

}  // namespace edsig::crypto

// clang-format off
// Order matters here
#include "base_bn.h"
#include "base_mod.h"
#include "base_hash.h"

// clang-format on
using edsig::crypto::bn_t;
using edsig::crypto::mod_t;
