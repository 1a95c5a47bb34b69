#pragma once

#include <edsig/core/macros.h>

#define _FUNCION_LOG_FORMAT_ __PRETTY_FUNCTION__

// A named integer or string parameter of a log frame. Strings are referenced, not copied.
class log_data_t {
 public:
  log_data_t() {}
  template <typename T>
  log_data_t(const char* _name, T param) : name(_name), kind(kind_int), int_value(int64_t(param)) {}
  log_data_t(const char* _name, const std::string& param) : name(_name), kind(kind_string), str_value(&param) {}

  void print(std::string& out) const;

 private:
  enum kind_e { kind_none, kind_int, kind_string };

  const char* name = "";
  kind_e kind = kind_none;
  int64_t int_value = 0;
  const std::string* str_value = nullptr;
};

/**
 * Names the enclosing function and a few of its parameters while in scope.
 * edsig::error prefixes every message with the live frames of the current thread, outermost first.
 */
class log_frame_t {
 public:
  template <typename... ARGS>
  explicit log_frame_t(const char* _func_name, const ARGS&... args) : func_name(_func_name) {
    (add(args), ...);
    push();
  }
  ~log_frame_t();

  log_frame_t(const log_frame_t&) = delete;
  log_frame_t& operator=(const log_frame_t&) = delete;

  static std::string current_frames();

 private:
  enum { max_params = 8 };

  const char* func_name;
  const log_frame_t* up = nullptr;
  int params_count = 0;
  log_data_t params[max_params];

  void add(const log_data_t& param) {
    if (params_count < max_params) params[params_count++] = param;
  }
  void push();
  void print(std::string& out) const;
};

#define LOG(x) log_data_t(#x, x)

// Silences edsig::error and assertion logging on the current thread while in scope. Scopes nest.
class dylog_disable_scope_t {
 public:
  dylog_disable_scope_t();
  ~dylog_disable_scope_t();

  dylog_disable_scope_t(const dylog_disable_scope_t&) = delete;
  dylog_disable_scope_t& operator=(const dylog_disable_scope_t&) = delete;

  static bool active();

 private:
  int saved;
};
