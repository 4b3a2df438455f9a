#ifndef MATRIX_DOT_HPP
#define MATRIX_DOT_HPP

#include <map>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <json/json.h>

// The homeserver as the rest of the program sees it.  Every operation
// either returns or throws Matrix::Error.

namespace Matrix {

enum class failure {
  network,      // no answer, or a garbled one
  unauthorized, // bad or missing access token
  forbidden,
  not_found,
  rate_limited,
  rejected, // any other refusal
};

char const* failure_name(failure f);

inline std::ostream& operator<<(std::ostream& os, failure f)
{
  return os << failure_name(f);
}

class Error : public std::runtime_error {
public:
  Error(failure kind, int status, std::string errcode, std::string const& what)
    : std::runtime_error(what)
    , kind_(kind)
    , status_(status)
    , errcode_(std::move(errcode))
  {
  }

  failure            kind() const { return kind_; }
  int                status() const { return status_; }
  std::string const& errcode() const { return errcode_; }

private:
  failure     kind_;
  int         status_;
  std::string errcode_;
};

// Map an HTTP status and Matrix errcode onto a failure kind.
failure classify(int status, std::string const& errcode);

enum class membership { none, invited, joined };

char const* membership_name(membership m);

struct LoginResult {
  std::string user_id;
  std::string access_token;
  std::string device_id;
};

struct DeviceKeys {
  std::string user_id;
  std::string device_id;
  std::string curve25519; // base64
  std::string ed25519;    // base64

  Json::Value json; // as served, for signature checks
};

// A claimed signed_curve25519 key.
struct OneTimeKey {
  std::string key_id; // "signed_curve25519:<id>"
  std::string key;    // base64

  Json::Value json;
};

// Content of a room's m.room.encryption state event.
struct EncryptionSettings {
  std::string               algorithm;
  std::optional<long long> rotation_period_ms;
  std::optional<long long> rotation_period_msgs;
};

using user_device = std::pair<std::string, std::string>;

class Homeserver {
public:
  virtual ~Homeserver() = default;

  virtual LoginResult login(std::string const& user,
                            std::string const& password,
                            std::string const& device_id,
                            std::string const& device_display_name)
      = 0;

  virtual void upload_keys(Json::Value const& device_keys,
                           Json::Value const& one_time_keys)
      = 0;

  // Room ID for #alias:server.
  virtual std::string resolve_alias(std::string const& alias) = 0;

  virtual membership get_membership(std::string const& room_id,
                                    std::string const& user_id)
      = 0;

  // Join (or accept an invite to) a room; returns the room ID.
  virtual std::string join(std::string const& room_id_or_alias) = 0;

  // nullopt for an unencrypted room.
  virtual std::optional<EncryptionSettings>
  get_encryption(std::string const& room_id) = 0;

  virtual std::vector<std::string>
  joined_members(std::string const& room_id) = 0;

  virtual std::vector<DeviceKeys>
  query_keys(std::vector<std::string> const& user_ids) = 0;

  // Devices without a key to give are missing from the result.
  virtual std::map<user_device, OneTimeKey>
  claim_keys(std::vector<user_device> const& devices) = 0;

  // messages is {user_id: {device_id: content}}.
  virtual void send_to_device(std::string const& event_type,
                              Json::Value const& messages)
      = 0;

  // Returns the event ID.
  virtual std::string send_event(std::string const& room_id,
                                 std::string const& event_type,
                                 Json::Value const& content)
      = 0;
};

} // namespace Matrix

#endif // MATRIX_DOT_HPP
