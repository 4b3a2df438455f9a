#ifndef OLM_DOT_HPP
#define OLM_DOT_HPP

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include <json/json.h>

#include "Crypto.hpp"

namespace Olm {

auto constexpr algorithm = "m.olm.v1.curve25519-aes-sha2";

// A device's long lived identity: the Curve25519 identity key, the
// Ed25519 fingerprint key and the one-time keys published for it.
class Account {
public:
  Account();
  Account(Crypto::Curve25519 identity, Crypto::Ed25519 fingerprint);

  // nullopt if any key material is missing or undecodable.
  static std::optional<Account> from_json(Json::Value const& v);
  Json::Value                   to_json() const;

  Crypto::Curve25519 const& identity() const { return identity_; }

  // Unpadded base64 public keys, as published.
  std::string curve25519_key() const;
  std::string ed25519_key() const;

  // Base64 signature over message.
  std::string sign(std::string_view message) const;

  // Add our signature to obj under signatures.user_id."ed25519:device_id".
  void sign_json(Json::Value&       obj,
                 std::string const& user_id,
                 std::string const& device_id) const;

  // Signed device_keys object for /keys/upload.
  Json::Value device_keys(std::string const& user_id,
                          std::string const& device_id) const;

  // Make count new one-time keys and return them signed, keyed by
  // "signed_curve25519:<id>", for /keys/upload.
  Json::Value generate_one_time_keys(size_t             count,
                                     std::string const& user_id,
                                     std::string const& device_id);

  size_t one_time_key_count() const { return one_time_keys_.size(); }

private:
  Crypto::Curve25519 identity_;
  Crypto::Ed25519    fingerprint_;

  std::map<std::string, Crypto::Curve25519> one_time_keys_;
  uint32_t                                  next_key_id_{1};
};

// Check the signature by user_id/key_id over obj with signatures and
// unsigned removed, against the base64 Ed25519 key.
bool verify_signed_json(Json::Value const& obj,
                        std::string const& user_id,
                        std::string const& key_id,
                        std::string const& ed25519_key);

struct Message {
  int         type; // 0 is a pre-key message
  std::string body; // base64
};

// Encrypt plaintext to one device over a new outbound session.  The
// keys are raw (decoded) Curve25519 keys.  Throws std::invalid_argument
// if either of their keys is unusable.
Message encrypt(Account const&   ours,
                std::string_view their_identity_key,
                std::string_view their_one_time_key,
                std::string_view plaintext);

} // namespace Olm

#endif // OLM_DOT_HPP
