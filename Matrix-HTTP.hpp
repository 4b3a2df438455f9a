#ifndef MATRIX_HTTP_DOT_HPP
#define MATRIX_HTTP_DOT_HPP

#include <chrono>
#include <string>

#include "HTTP.hpp"
#include "Matrix.hpp"
#include "Url.hpp"

namespace Matrix {

// The client-server API (v3) over HTTP.  Holds no mutable state, so one
// instance may be shared by every worker.
class Client : public Homeserver {
public:
  Client(Url                       base,
         std::string               access_token,
         std::chrono::milliseconds timeout);

  LoginResult login(std::string const& user,
                    std::string const& password,
                    std::string const& device_id,
                    std::string const& device_display_name) override;

  void upload_keys(Json::Value const& device_keys,
                   Json::Value const& one_time_keys) override;

  std::string resolve_alias(std::string const& alias) override;

  membership get_membership(std::string const& room_id,
                            std::string const& user_id) override;

  std::string join(std::string const& room_id_or_alias) override;

  std::optional<EncryptionSettings>
  get_encryption(std::string const& room_id) override;

  std::vector<std::string> joined_members(std::string const& room_id) override;

  std::vector<DeviceKeys>
  query_keys(std::vector<std::string> const& user_ids) override;

  std::map<user_device, OneTimeKey>
  claim_keys(std::vector<user_device> const& devices) override;

  void send_to_device(std::string const& event_type,
                      Json::Value const& messages) override;

  std::string send_event(std::string const& room_id,
                         std::string const& event_type,
                         Json::Value const& content) override;

private:
  Json::Value call_(char const*        method,
                    std::string const& path,
                    Json::Value const* body,
                    std::string const& secret) const;

  Json::Value get_(std::string const& path) const;
  Json::Value post_(std::string const& path, Json::Value const& body) const;
  Json::Value put_(std::string const& path, Json::Value const& body) const;

  HTTP::Client http_;
  std::string  access_token_;
};

} // namespace Matrix

#endif // MATRIX_HTTP_DOT_HPP
