#include <iostream>

#include <edsig/crypto/base_eddsa.h>

using namespace edsig;
using namespace edsig::crypto;

ed25519::key_pair_t keygen()
{
  ed25519::key_pair_t key = ed25519::generate_key_pair();
  std::cout << "secret = " << strext::to_hex(key.secret) << "\n";
  std::cout << "public = " << strext::to_hex(key.pub) << "\n";
  return key;
}

error_t sign_and_verify(const ed25519::key_pair_t& key, mem_t msg)
{
  error_t rv = UNINITIALIZED_ERROR;
  buf_t sig = ed25519::sign(msg, key.secret, key.pub);
  std::cout << "signature = " << strext::to_hex(sig) << "\n";

  bool valid = false;
  if (rv = ed25519::verify(sig, msg, key.pub, valid)) return rv;
  std::cout << "valid = " << valid << "\n";

  buf_t tampered = sig;
  tampered[40] ^= 1;
  if (rv = ed25519::verify(tampered, msg, key.pub, valid)) return rv;
  std::cout << "tampered valid = " << valid << "\n";
  return SUCCESS;
}

error_t convert(const ed25519::key_pair_t& key)
{
  error_t rv = UNINITIALIZED_ERROR;
  buf_t x_secret, x_public;
  if (rv = ed25519::to_curve25519(key.secret, ed25519::key_kind_e::secret_key, x_secret)) return rv;
  if (rv = ed25519::to_curve25519(key.pub, ed25519::key_kind_e::public_key, x_public)) return rv;
  std::cout << "x25519 secret = " << strext::to_hex(x_secret) << "\n";
  std::cout << "x25519 public = " << strext::to_hex(x_public) << "\n";
  return SUCCESS;
}

int main(int argc, const char* argv[])
{
  error_t rv = UNINITIALIZED_ERROR;
  hash_config_t config;
  if (rv = hash_config_t::from_env(config)) return 1;
  std::cout << "hash: " << (config.keyed() ? "hmac-sha512" : config.to_string()) << "\n";

  std::cout << "================ keygen ===============\n";
  ed25519::key_pair_t key = keygen();

  std::cout << "============ sign / verify ============\n";
  std::string msg = argc > 1 ? argv[1] : "hello ed25519";
  std::cout << "sign / verify: " << sign_and_verify(key, strext::mem(msg)) << "\n";

  std::cout << "============== x25519 =================\n";
  std::cout << "convert: " << convert(key) << "\n";

  std::cout << "============== on_curve ===============\n";
  std::cout << "public key on curve: " << ed25519::on_curve(key.pub) << "\n";
  std::cout << "random bytes on curve: " << ed25519::on_curve(gen_random(32)) << "\n";

  return 0;
}
