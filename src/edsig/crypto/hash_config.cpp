#include "hash_config.h"

namespace edsig::crypto {

static const char hmac_prefix[] = "hmac-sha512:";

static const std::map<std::string, hash_e>& hash_names() {
  static const std::map<std::string, hash_e> names = {
      {"sha512", hash_e::sha512},
      {"sha3-512", hash_e::sha3_512},
      {"blake2b512", hash_e::blake2b},
      {"blake2b", hash_e::blake2b},
  };
  return names;
}

error_t hash_config_t::from_string(const std::string& text, hash_config_t& out) {
  std::string name = text;
  strext::trim(name);
  std::string lower = strext::to_lower(name);

  if (strext::starts_with(lower, hmac_prefix)) {
    std::string hex = name.substr(strlen(hmac_prefix));
    strext::trim(hex);
    buf_t key;
    if (hex.empty() || !strext::from_hex(key, hex)) return edsig::error(E_FORMAT, "bad HMAC key in hash config");

    out.alg = hash_e::sha512;
    out.hmac_key = key;
    return SUCCESS;
  }

  const auto& names = hash_names();
  auto it = names.find(lower);
  if (it == names.end()) return edsig::error(E_NOT_SUPPORTED, "unknown hash \"" + name + "\"");

  out.alg = it->second;
  out.hmac_key.free();
  return SUCCESS;
}

error_t hash_config_t::from_env(hash_config_t& out) {
  error_t rv = UNINITIALIZED_ERROR;
  std::string value = strext::from_char_ptr(getenv(env_var));
  strext::trim(value);
  if (value.empty()) {
    out = hash_config_t();
    return SUCCESS;
  }

  if (rv = from_string(value, out)) return edsig::error(rv, std::string("invalid ") + env_var);
  return SUCCESS;
}

std::string hash_config_t::to_string() const {
  if (keyed()) return hmac_prefix + strext::to_hex(hmac_key);
  for (const auto& [name, type] : hash_names()) {
    if (type == alg) return name;
  }
  return "";
}

hash_fn_t hash_config_t::hash_fn() const {
  if (keyed()) {
    buf_t key = hmac_key;
    return [key](mem_t m) { return hmac_sha512_t(key).calculate(m); };
  }

  hash_e type = alg;
  return [type](mem_t m) { return hash_t(type).init().update(m).final(); };
}

const hash_fn_t& default_hash_fn() {
  static const hash_fn_t fn = [] {
    hash_config_t config;
    error_t rv = hash_config_t::from_env(config);
    edsig_assert(rv == SUCCESS);
    return config.hash_fn();
  }();
  return fn;
}

}  // namespace edsig::crypto
