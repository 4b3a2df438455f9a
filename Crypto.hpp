#ifndef CRYPTO_DOT_HPP
#define CRYPTO_DOT_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

// Thin wrappers over OpenSSL's EVP layer.  Binary values travel as
// std::string.  Failures of the library itself are CHECKed; bad key
// material from the other side throws std::invalid_argument.

namespace Crypto {

auto constexpr key_size       = 32;
auto constexpr signature_size = 64;
auto constexpr mac_size       = 32;

std::string random_bytes(size_t n);

std::string sha256(std::string_view data);
std::string hmac_sha256(std::string_view key, std::string_view data);

// RFC 5869; an empty salt means HashLen zero octets.
std::string hkdf_sha256(std::string_view ikm,
                        std::string_view salt,
                        std::string_view info,
                        size_t           length);

// PKCS#7 padded.
std::string aes256_cbc_encrypt(std::string_view key,
                               std::string_view iv,
                               std::string_view plaintext);
std::optional<std::string> aes256_cbc_decrypt(std::string_view key,
                                              std::string_view iv,
                                              std::string_view ciphertext);

class Curve25519 {
public:
  Curve25519(); // fresh random key pair
  explicit Curve25519(std::string_view private_key);

  std::string const& private_key() const { return private_; }
  std::string const& public_key() const { return public_; }

  // X25519 shared secret with their_public.
  std::string agree(std::string_view their_public) const;

private:
  std::string private_;
  std::string public_;
};

class Ed25519 {
public:
  Ed25519(); // fresh random key pair
  explicit Ed25519(std::string_view seed);

  std::string const& seed() const { return seed_; }
  std::string const& public_key() const { return public_; }

  std::string sign(std::string_view message) const;

  static bool verify(std::string_view public_key,
                     std::string_view message,
                     std::string_view signature);

private:
  std::string seed_;
  std::string public_;
};

} // namespace Crypto

#endif // CRYPTO_DOT_HPP
