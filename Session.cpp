#include "Session.hpp"

#include <stdexcept>

#include <glog/logging.h>

namespace {
std::string const no_device;

std::optional<std::string> string_field(Json::Value const& v, char const* name)
{
  if (!v[name].isString())
    return {};
  return v[name].asString();
}
} // namespace

Session::Session(std::string    homeserver,
                 std::string    user_id,
                 std::string    access_token,
                 DeviceIdentity identity,
                 std::string    device_display_name)
  : homeserver_(std::move(homeserver))
  , user_id_(std::move(user_id))
  , access_token_(std::move(access_token))
  , device_display_name_(std::move(device_display_name))
{
  if (access_token_.empty() != identity.device_id.empty()) {
    throw std::invalid_argument(
        "access token and device ID must both be present or both absent");
  }
  if (!access_token_.empty()) {
    identity_ = std::move(identity);
  }
}

std::string const& Session::device_id() const
{
  return identity_ ? identity_->device_id : no_device;
}

DeviceIdentity const& Session::identity() const
{
  CHECK(identity_) << "no device identity on an unauthenticated session";
  return *identity_;
}

Json::Value Session::to_json() const
{
  Json::Value v{Json::objectValue};
  v["homeserver"]          = homeserver_;
  v["user_id"]             = user_id_;
  v["access_token"]        = access_token_;
  v["device_id"]           = device_id();
  v["device_display_name"] = device_display_name_;
  if (identity_) {
    v["account"] = identity_->account.to_json();
  }
  return v;
}

std::optional<Session> Session::from_json(Json::Value const& v)
{
  if (!v.isObject())
    return {};

  auto const homeserver   = string_field(v, "homeserver");
  auto const user_id      = string_field(v, "user_id");
  auto const access_token = string_field(v, "access_token");
  auto const device_id    = string_field(v, "device_id");
  auto const display_name = string_field(v, "device_display_name");
  if (!homeserver || !user_id || !access_token || !device_id) {
    LOG(WARNING) << "credential record is missing fields";
    return {};
  }
  if (access_token->empty() != device_id->empty()) {
    LOG(WARNING) << "credential record has only one of token and device";
    return {};
  }
  if (access_token->empty()) {
    return Session(*homeserver);
  }

  auto account = Olm::Account::from_json(v["account"]);
  if (!account) {
    LOG(WARNING) << "credential record has unusable key material";
    return {};
  }

  return Session(*homeserver, *user_id, *access_token,
                 DeviceIdentity{*device_id, std::move(*account)},
                 display_name.value_or(""));
}
