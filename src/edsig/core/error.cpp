#include "error.h"

#include <edsig/core/log.h>
#include <edsig/core/strext.h>

static thread_local const log_frame_t* tls_top_frame = nullptr;
static thread_local int tls_log_disabled = 0;

namespace edsig {

bool test_error_storing_mode = false;
std::string g_test_log_str;

out_log_str_f out_log_fun = nullptr;
out_log_str_f test_log_fun = [](int mode, const char* str) { g_test_log_str += "; " + std::string(str); };

enum { log_item_error = 6 };

static void write_log(const std::string& s) {
  if (out_log_fun)
    out_log_fun(log_item_error, s.c_str());
  else
    std::cerr << s;
}

static std::string hex_code(error_t rv) {
  char buf[16];
  snprintf(buf, sizeof(buf), "0x%08x", uint32_t(rv));
  return buf;
}

error_t error(error_t rv, const std::string& text, bool to_print_stack_trace) {
  if (dylog_disable_scope_t::active()) return rv;

  if (to_print_stack_trace) print_stack_trace();
  if (test_error_storing_mode && !text.empty()) test_log_fun(0, text.c_str());

  std::string line = log_frame_t::current_frames() + "Error " + hex_code(rv);
  if (!text.empty()) line += ": " + text;
  write_log(line + "\n");
  return rv;
}

// no stack trace by default
error_t error(error_t rv, const std::string& text) { return error(rv, text, false); }

error_t error(error_t rv) { return error(rv, std::string()); }

struct backtrace_state_t {
  void** current;
  void** end;
};

static _Unwind_Reason_Code unwind_callback(struct _Unwind_Context* context, void* arg) {
  backtrace_state_t* state = static_cast<backtrace_state_t*>(arg);
  uintptr_t pc = _Unwind_GetIP(context);
  if (!pc) return _URC_NO_REASON;
  if (state->current == state->end) return _URC_END_OF_STACK;
  *state->current++ = void_ptr(pc);
  return _URC_NO_REASON;
}

static std::string symbol_name(const Dl_info& info) {
  std::string symbol = strext::from_char_ptr(info.dli_sname);
  if (symbol.empty()) return symbol;

  int status = 0;
  char* demangled = abi::__cxa_demangle(symbol.c_str(), nullptr, nullptr, &status);
  if (demangled) {
    symbol = demangled;
    ::free(demangled);  // NOLINT:cppcoreguidelines-no-malloc
  }
  return symbol;
}

void print_stack_trace() {
  enum { max_depth = 64 };
  void* buffer[max_depth];
  backtrace_state_t state = {buffer, buffer + max_depth};
  _Unwind_Backtrace(unwind_callback, &state);

  std::string out;
  for (int idx = 0; buffer + idx < state.current; ++idx) {
    Dl_info info = {0};
    dladdr(buffer[idx], &info);

    const char* module = info.dli_fname ? info.dli_fname : "";
    if (const char* slash = strrchr(module, '/')) module = slash + 1;

    char addr[24];
    snprintf(addr, sizeof(addr), "%p", buffer[idx]);
    out += "##" + std::to_string(idx) + " " + module + " " + addr + " " + symbol_name(info) + "\n";
  }
  write_log(out);
}

void assert_failed(const char* msg, const char* file, int line) {
  if (!dylog_disable_scope_t::active()) {
    std::string path = file;
    auto pos = path.rfind("src/");
    if (pos != std::string::npos) path.erase(0, pos);

    write_log("[ASSERTION FAILED] " + std::string(msg) + " (File: " + path + "#L" + std::to_string(line) + ")\n");
    print_stack_trace();
  }
  throw assertion_failed_t(msg);
}

}  // namespace edsig

// "int edsig::crypto::ed25519::eddsa_t::verify(edsig::mem_t, ...) const" -> "edsig::crypto::ed25519::eddsa_t::verify"
static std::string short_function_name(const std::string& pretty) {
  size_t end = pretty.find('(');
  if (end == std::string::npos) end = pretty.size();
  size_t begin = pretty.rfind(' ', end);
  begin = (begin == std::string::npos) ? 0 : begin + 1;
  return pretty.substr(begin, end - begin);
}

void log_data_t::print(std::string& out) const {
  out += name;
  out += '=';
  if (kind == kind_int)
    out += std::to_string(int_value);
  else if (kind == kind_string)
    out += *str_value;
}

void log_frame_t::push() {
  up = tls_top_frame;
  tls_top_frame = this;
}

log_frame_t::~log_frame_t() { tls_top_frame = up; }

void log_frame_t::print(std::string& out) const {
  out += short_function_name(func_name);
  out += '(';
  for (int i = 0; i < params_count; i++) {
    if (i > 0) out += ", ";
    params[i].print(out);
  }
  out += ')';
}

std::string log_frame_t::current_frames() {
  std::vector<const log_frame_t*> chain;
  for (const log_frame_t* f = tls_top_frame; f; f = f->up) chain.push_back(f);

  std::string out;
  for (auto it = chain.rbegin(); it != chain.rend(); ++it) {
    (*it)->print(out);
    out += '\n';
  }
  return out;
}

dylog_disable_scope_t::dylog_disable_scope_t() : saved(tls_log_disabled) { tls_log_disabled++; }

dylog_disable_scope_t::~dylog_disable_scope_t() { tls_log_disabled = saved; }

bool dylog_disable_scope_t::active() { return tls_log_disabled > 0; }
