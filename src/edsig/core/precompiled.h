#ifndef EDSIG_PRECOMPILED_H
#define EDSIG_PRECOMPILED_H

#include <ctype.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include <algorithm>
#include <exception>
#include <functional>
#include <iostream>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

// stack traces
#include <cxxabi.h>
#include <dlfcn.h>
#include <unwind.h>

#include <openssl/bn.h>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/objects.h>
#include <openssl/params.h>
#include <openssl/rand.h>

#endif  // EDSIG_PRECOMPILED_H
