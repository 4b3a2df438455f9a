#ifndef SESSION_DOT_HPP
#define SESSION_DOT_HPP

#include <optional>
#include <string>

#include <json/json.h>

#include "Olm.hpp"

// This device's keys.  Made once at login and kept for as long as the
// login is; a new identity needs a new login.
struct DeviceIdentity {
  std::string  device_id;
  Olm::Account account;

  std::string curve25519_key() const { return account.curve25519_key(); }
  std::string ed25519_key() const { return account.ed25519_key(); }
};

// Who we are on which homeserver.  The access token and the device
// identity are either both present or both absent.
class Session {
public:
  Session() = default;

  explicit Session(std::string homeserver) : homeserver_(std::move(homeserver))
  {
  }

  // Throws std::invalid_argument if exactly one of access_token and
  // identity.device_id is empty.
  Session(std::string    homeserver,
          std::string    user_id,
          std::string    access_token,
          DeviceIdentity identity,
          std::string    device_display_name);

  std::string const& homeserver() const { return homeserver_; }
  std::string const& user_id() const { return user_id_; }
  std::string const& access_token() const { return access_token_; }
  std::string const& device_id() const;
  std::string const& device_display_name() const { return device_display_name_; }

  bool authenticated() const { return !access_token_.empty(); }

  // Only for an authenticated session.
  DeviceIdentity const& identity() const;

  Json::Value                   to_json() const;
  static std::optional<Session> from_json(Json::Value const& v);

private:
  std::string homeserver_;
  std::string user_id_;
  std::string access_token_;
  std::string device_display_name_;

  std::optional<DeviceIdentity> identity_;
};

#endif // SESSION_DOT_HPP
