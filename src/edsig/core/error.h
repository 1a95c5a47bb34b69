#pragma once
#include <edsig/core/precompiled.h>

typedef int error_t;

#define ERRCODE(category, code) (0xff000000 | (uint32_t(category) << 16) | uint32_t(code))
#define ECATEGORY(code) (((code) >> 16) & 0x00ff)

// clang-format off
enum {
  ECATEGORY_GENERIC      = 0x01,
  ECATEGORY_CRYPTO       = 0x04,
};

enum {
  SUCCESS = 0,
  UNINITIALIZED_ERROR = ERRCODE(ECATEGORY_GENERIC, 0x0000), // never returned by a finished function
  E_BADARG            = ERRCODE(ECATEGORY_GENERIC, 0x0002),
  E_FORMAT            = ERRCODE(ECATEGORY_GENERIC, 0x0003),
  E_NOT_SUPPORTED     = ERRCODE(ECATEGORY_GENERIC, 0x0005),
};
// clang-format on

namespace edsig {

/**
 * Logs "Error 0x<rv>: <text>" after the active log frames and returns rv unchanged,
 * so failures are reported and propagated in one statement:
 *   if (rv = decode(...)) return edsig::error(rv, "bad key");
 */
error_t error(error_t rv, const std::string& text, bool to_print_stack_trace);
error_t error(error_t rv, const std::string& text);
error_t error(error_t rv);

// Log sink; std::cerr when not set.
typedef void (*out_log_str_f)(int mode, const char* str);
extern out_log_str_f out_log_fun;

extern bool test_error_storing_mode;
extern std::string g_test_log_str;
extern out_log_str_f test_log_fun;

void print_stack_trace();

[[noreturn]] void assert_failed(const char* msg, const char* file, int line);

class assertion_failed_t : public std::logic_error {
 public:
  assertion_failed_t(const std::string& msg) : std::logic_error(msg) {}
};

inline void set_test_error_storing_mode(bool enabled) {
  test_error_storing_mode = enabled;
  g_test_log_str = "test error log";
}

}  // namespace edsig

#define edsig_assert(expr)                                                             \
  do {                                                                                 \
    if (__builtin_expect(!(expr), 0)) edsig::assert_failed(#expr, __FILE__, __LINE__); \
  } while (0)
