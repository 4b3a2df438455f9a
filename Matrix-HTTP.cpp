#include "Matrix-HTTP.hpp"

#include <fmt/format.h>

#include <glog/logging.h>

#include "Matrix-json.hpp"
#include "Pill.hpp"

namespace Config {
constexpr auto api_prefix = "/_matrix/client/v3";

// How long the server may wait on other servers for keys.
constexpr auto federation_timeout_ms = 10000;
} // namespace Config

namespace {
std::string enc(std::string const& segment)
{
  return Url::percent_encode(segment);
}

std::string string_member(Json::Value const& v,
                          char const*        name,
                          char const*        what)
{
  if (!v.isObject() || !v[name].isString()) {
    throw Matrix::Error(Matrix::failure::network, 200, "",
                        fmt::format("{} response lacks {}", what, name));
  }
  return v[name].asString();
}
} // namespace

namespace Matrix {

Client::Client(Url                       base,
               std::string               access_token,
               std::chrono::milliseconds timeout)
  : http_(std::move(base), timeout)
  , access_token_(std::move(access_token))
{
}

Json::Value Client::call_(char const*        method,
                          std::string const& path,
                          Json::Value const* body,
                          std::string const& secret) const
{
  HTTP::Request req;
  req.method = method;
  req.target = Config::api_prefix + path;
  req.headers.emplace_back("Accept", "application/json");
  if (!access_token_.empty()) {
    req.headers.emplace_back("Authorization",
                             fmt::format("Bearer {}", access_token_));
  }
  if (body) {
    req.headers.emplace_back("Content-Type", "application/json");
    req.body = canonical_json(*body);
  }

  std::optional<HTTP::Response> rsp;
  try {
    rsp = http_.exchange(req, secret.empty() ? access_token_ : secret);
  }
  catch (std::runtime_error const& e) {
    throw Error(failure::network, 0, "",
                fmt::format("{} {}: {}", method, path, e.what()));
  }
  if (!rsp) {
    throw Error(failure::network, 0, "",
                fmt::format("{} {}: no usable response", method, path));
  }

  Json::Value v;
  if (!rsp->body.empty()) {
    try {
      v = parse_json(rsp->body);
    }
    catch (std::invalid_argument const& e) {
      LOG(WARNING) << method << " " << path << ": " << e.what();
      if (rsp->status / 100 == 2) {
        throw Error(failure::network, rsp->status, "",
                    fmt::format("{} {}: unparsable body", method, path));
      }
    }
  }

  if (rsp->status / 100 == 2) {
    if (v.isNull())
      return Json::Value{Json::objectValue};
    if (!v.isObject()) {
      throw Error(failure::network, rsp->status, "",
                  fmt::format("{} {}: body is not an object", method, path));
    }
    return v;
  }

  std::string errcode;
  std::string error;
  if (v.isObject()) {
    if (v["errcode"].isString())
      errcode = v["errcode"].asString();
    if (v["error"].isString())
      error = v["error"].asString();
  }
  auto const kind = classify(rsp->status, errcode);
  throw Error(kind, rsp->status, errcode,
              fmt::format("{} {}: {} {} {}", method, path, rsp->status,
                          errcode, error));
}

Json::Value Client::get_(std::string const& path) const
{
  return call_("GET", path, nullptr, "");
}

Json::Value Client::post_(std::string const& path, Json::Value const& body) const
{
  return call_("POST", path, &body, "");
}

Json::Value Client::put_(std::string const& path, Json::Value const& body) const
{
  return call_("PUT", path, &body, "");
}

LoginResult Client::login(std::string const& user,
                          std::string const& password,
                          std::string const& device_id,
                          std::string const& device_display_name)
{
  Json::Value body{Json::objectValue};
  body["type"]                   = "m.login.password";
  body["identifier"]["type"]     = "m.id.user";
  body["identifier"]["user"]     = user;
  body["password"]               = password;
  if (!device_id.empty())
    body["device_id"] = device_id;
  if (!device_display_name.empty())
    body["initial_device_display_name"] = device_display_name;

  auto const rsp = call_("POST", "/login", &body, password);

  LoginResult result;
  result.user_id      = string_member(rsp, "user_id", "login");
  result.access_token = string_member(rsp, "access_token", "login");
  result.device_id    = string_member(rsp, "device_id", "login");
  return result;
}

void Client::upload_keys(Json::Value const& device_keys,
                         Json::Value const& one_time_keys)
{
  Json::Value body{Json::objectValue};
  if (!device_keys.isNull())
    body["device_keys"] = device_keys;
  if (!one_time_keys.isNull())
    body["one_time_keys"] = one_time_keys;

  auto const rsp = post_("/keys/upload", body);
  VLOG(1) << "one_time_key_counts " << rsp["one_time_key_counts"];
}

std::string Client::resolve_alias(std::string const& alias)
{
  auto const rsp = get_(fmt::format("/directory/room/{}", enc(alias)));
  return string_member(rsp, "room_id", "directory");
}

membership Client::get_membership(std::string const& room_id,
                                  std::string const& user_id)
{
  Json::Value rsp;
  try {
    rsp = get_(fmt::format("/rooms/{}/state/m.room.member/{}", enc(room_id),
                           enc(user_id)));
  }
  catch (Error const& e) {
    // Not a member, and not allowed to look.
    if (e.kind() == failure::not_found || e.kind() == failure::forbidden)
      return membership::none;
    throw;
  }

  auto const m
      = rsp["membership"].isString() ? rsp["membership"].asString() : "";
  if (m == "join")
    return membership::joined;
  if (m == "invite")
    return membership::invited;
  return membership::none;
}

std::string Client::join(std::string const& room_id_or_alias)
{
  auto const rsp = post_(fmt::format("/join/{}", enc(room_id_or_alias)),
                         Json::Value{Json::objectValue});
  return string_member(rsp, "room_id", "join");
}

std::optional<EncryptionSettings>
Client::get_encryption(std::string const& room_id)
{
  Json::Value rsp;
  try {
    rsp = get_(fmt::format("/rooms/{}/state/m.room.encryption", enc(room_id)));
  }
  catch (Error const& e) {
    if (e.kind() == failure::not_found)
      return {};
    throw;
  }

  EncryptionSettings settings;
  if (rsp["algorithm"].isString())
    settings.algorithm = rsp["algorithm"].asString();
  if (rsp["rotation_period_ms"].isIntegral())
    settings.rotation_period_ms = rsp["rotation_period_ms"].asInt64();
  if (rsp["rotation_period_msgs"].isIntegral())
    settings.rotation_period_msgs = rsp["rotation_period_msgs"].asInt64();
  return settings;
}

std::vector<std::string> Client::joined_members(std::string const& room_id)
{
  auto const rsp
      = get_(fmt::format("/rooms/{}/joined_members", enc(room_id)));
  auto const& joined = rsp["joined"];
  if (!joined.isObject()) {
    throw Error(failure::network, 200, "", "joined_members lacks joined");
  }
  return joined.getMemberNames();
}

std::vector<DeviceKeys>
Client::query_keys(std::vector<std::string> const& user_ids)
{
  Json::Value body{Json::objectValue};
  body["timeout"] = Config::federation_timeout_ms;
  for (auto const& user : user_ids) {
    body["device_keys"][user] = Json::Value{Json::arrayValue};
  }
  auto const rsp = post_("/keys/query", body);

  std::vector<DeviceKeys> keys;
  auto const& users = rsp["device_keys"];
  if (!users.isObject())
    return keys;

  for (auto const& user : users.getMemberNames()) {
    auto const& devices = users[user];
    if (!devices.isObject())
      continue;
    for (auto const& device : devices.getMemberNames()) {
      auto const& dk = devices[device];
      if (!dk.isObject() || !dk["keys"].isObject()
          || dk["user_id"] != Json::Value(user)
          || dk["device_id"] != Json::Value(device)) {
        LOG(WARNING) << "ignoring inconsistent keys for " << user << " "
                     << device;
        continue;
      }
      auto const& curve = dk["keys"][fmt::format("curve25519:{}", device)];
      auto const& ed    = dk["keys"][fmt::format("ed25519:{}", device)];
      if (!curve.isString() || !ed.isString()) {
        LOG(WARNING) << "incomplete keys for " << user << " " << device;
        continue;
      }
      keys.push_back(DeviceKeys{user, device, curve.asString(), ed.asString(), dk});
    }
  }
  return keys;
}

std::map<user_device, OneTimeKey>
Client::claim_keys(std::vector<user_device> const& devices)
{
  Json::Value body{Json::objectValue};
  body["timeout"] = Config::federation_timeout_ms;
  for (auto const& [user, device] : devices) {
    body["one_time_keys"][user][device] = "signed_curve25519";
  }
  auto const rsp = post_("/keys/claim", body);

  std::map<user_device, OneTimeKey> claimed;
  auto const& users = rsp["one_time_keys"];
  if (!users.isObject())
    return claimed;

  for (auto const& [user, device] : devices) {
    if (!users[user].isObject())
      continue;
    auto const& keys = users[user][device];
    if (!keys.isObject())
      continue;
    for (auto const& key_id : keys.getMemberNames()) {
      auto const& k = keys[key_id];
      if (key_id.rfind("signed_curve25519:", 0) != 0 || !k.isObject()
          || !k["key"].isString())
        continue;
      claimed.emplace(user_device{user, device},
                      OneTimeKey{key_id, k["key"].asString(), k});
      break;
    }
  }
  return claimed;
}

void Client::send_to_device(std::string const& event_type,
                            Json::Value const& messages)
{
  Json::Value body{Json::objectValue};
  body["messages"] = messages;
  put_(fmt::format("/sendToDevice/{}/{}", enc(event_type), Pill{}.as_string()),
       body);
}

std::string Client::send_event(std::string const& room_id,
                               std::string const& event_type,
                               Json::Value const& content)
{
  auto const rsp
      = put_(fmt::format("/rooms/{}/send/{}/{}", enc(room_id), enc(event_type),
                         Pill{}.as_string()),
             content);
  return string_member(rsp, "event_id", "send");
}

} // namespace Matrix
