#include "Send.hpp"

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <vector>

#include <fmt/format.h>

#include <gflags/gflags.h>

#include <glog/logging.h>

#include "Base64.hpp"
#include "Matrix-json.hpp"
#include "Olm.hpp"

DEFINE_uint64(rotation_msgs,
              Config::rotation_msgs,
              "messages per group session, unless the room says otherwise");
DEFINE_uint64(rotation_period,
              Config::rotation_period,
              "seconds per group session, unless the room says otherwise");

namespace {
send_error error_for(Matrix::failure f)
{
  switch (f) {
  case Matrix::failure::network: return send_error::network_failure;
  case Matrix::failure::unauthorized:
  case Matrix::failure::forbidden: return send_error::unauthorized;
  case Matrix::failure::rate_limited: return send_error::rate_limited;
  case Matrix::failure::not_found:
  case Matrix::failure::rejected: return send_error::rejected;
  }
  LOG(FATAL) << "unknown failure";
  return send_error::rejected;
}

Json::Value text_content(std::string const& body)
{
  Json::Value content;
  content["msgtype"] = "m.text";
  content["body"]    = body;
  return content;
}

std::string device_name(Matrix::user_device const& id)
{
  return fmt::format("{} {}", id.first, id.second);
}
} // namespace

Sender::Sender(Matrix::Homeserver& hs,
               Session const&      session,
               TrustPolicy const&  trust)
  : hs_(hs)
  , session_(session)
  , trust_(trust)
{
  CHECK(session_.authenticated());
}

std::shared_ptr<Sender::Room> Sender::room_(std::string const& room_id)
{
  std::lock_guard<std::mutex> lock(mtx_);
  auto& r = rooms_[room_id];
  if (!r)
    r = std::make_shared<Room>();
  return r;
}

std::optional<std::string> Sender::session_id(std::string const& room_id)
{
  auto const room = room_(room_id);

  std::lock_guard<std::mutex> lock(room->mtx);
  if (!room->group)
    return {};
  return room->group->session.session_id();
}

std::optional<send_error> Sender::send(RoomHandle const&  handle,
                                       std::string const& body)
{
  if (!handle.encryption_required())
    return send_plain_(handle, body);

  auto const room = room_(handle.room_id);

  std::lock_guard<std::mutex> lock(room->mtx);

  auto const err = attempt_(handle, *room, body, false);
  if (err != send_error::stale_key)
    return err;

  LOG(WARNING) << handle.address << ": stale key, once more with a new session";
  return attempt_(handle, *room, body, true);
}

std::optional<send_error> Sender::send_plain_(RoomHandle const&  handle,
                                              std::string const& body)
{
  try {
    auto const event_id
        = hs_.send_event(handle.room_id, "m.room.message", text_content(body));
    LOG(INFO) << handle.address << ": sent " << event_id;
  }
  catch (Matrix::Error const& e) {
    LOG(WARNING) << handle.address << ": " << e.what();
    return error_for(e.kind());
  }
  return {};
}

std::optional<send_error> Sender::attempt_(RoomHandle const&  handle,
                                           Room&              room,
                                           std::string const& body,
                                           bool               force_rotation)
{
  auto const& algorithm = handle.encryption->algorithm;
  if (algorithm != Megolm::algorithm) {
    LOG(WARNING) << handle.address << ": unsupported encryption " << algorithm;
    return send_error::unsupported_encryption;
  }

  try {
    auto const devices = find_recipients_(handle.room_id);

    fingerprint fp;
    for (auto const& [id, keys] : devices)
      fp[id] = std::make_pair(keys.curve25519, keys.ed25519);

    if (force_rotation || !room.group || rotation_due_(handle, *room.group, fp)) {
      // The old session is gone whether or not the new one makes it.
      room.group.reset();
      auto group = std::make_unique<Group>();
      if (auto const err = share_(handle.room_id, *group, devices); err)
        return err;
      group->shared_with = std::move(fp);
      room.group         = std::move(group);
    }

    auto& session = room.group->session;

    Json::Value payload;
    payload["type"]    = "m.room.message";
    payload["content"] = text_content(body);
    payload["room_id"] = handle.room_id;

    Json::Value content;
    content["algorithm"]  = Megolm::algorithm;
    content["sender_key"] = session_.identity().curve25519_key();
    content["session_id"] = session.session_id();
    content["device_id"]  = session_.device_id();
    content["ciphertext"] = session.encrypt(Matrix::canonical_json(payload));

    auto const event_id
        = hs_.send_event(handle.room_id, "m.room.encrypted", content);
    LOG(INFO) << handle.address << ": sent " << event_id << " encrypted, index "
              << session.message_index() - 1;
  }
  catch (Matrix::Error const& e) {
    LOG(WARNING) << handle.address << ": " << e.what();
    return error_for(e.kind());
  }
  return {};
}

Sender::recipients Sender::find_recipients_(std::string const& room_id)
{
  recipients devices;

  auto const members = hs_.joined_members(room_id);
  if (members.empty())
    return devices;

  for (auto& dk : hs_.query_keys(members)) {
    if (dk.user_id == session_.user_id() && dk.device_id == session_.device_id())
      continue;

    auto const key_id = fmt::format("ed25519:{}", dk.device_id);
    if (dk.curve25519.empty()
        || !Olm::verify_signed_json(dk.json, dk.user_id, key_id, dk.ed25519)) {
      LOG(WARNING) << "skipping " << dk.user_id << " " << dk.device_id
                   << ": device keys not properly signed";
      continue;
    }
    if (trust_.decide(dk) != trust::trusted) {
      LOG(INFO) << "not trusted: " << dk.user_id << " " << dk.device_id;
      continue;
    }
    auto id = Matrix::user_device{dk.user_id, dk.device_id};
    devices.emplace(std::move(id), std::move(dk));
  }
  return devices;
}

bool Sender::rotation_due_(RoomHandle const&  handle,
                           Group const&       group,
                           fingerprint const& devices) const
{
  auto const& enc = *handle.encryption;

  uint64_t max_msgs = FLAGS_rotation_msgs;
  if (enc.rotation_period_msgs)
    max_msgs = static_cast<uint64_t>(std::max(0LL, *enc.rotation_period_msgs));

  auto max_age = std::chrono::milliseconds(
      std::chrono::seconds(FLAGS_rotation_period));
  if (enc.rotation_period_ms)
    max_age = std::chrono::milliseconds(*enc.rotation_period_ms);

  if (group.session.message_index() >= max_msgs) {
    LOG(INFO) << handle.room_id << ": group session used up";
    return true;
  }
  if (std::chrono::steady_clock::now() - group.session.created() >= max_age) {
    LOG(INFO) << handle.room_id << ": group session expired";
    return true;
  }
  if (group.shared_with != devices) {
    LOG(INFO) << handle.room_id << ": recipient devices changed";
    return true;
  }
  return false;
}

std::optional<send_error> Sender::share_(std::string const& room_id,
                                         Group&             group,
                                         recipients const&  devices)
{
  if (devices.empty()) {
    LOG(INFO) << room_id << ": no other devices to share with";
    return {};
  }

  std::vector<Matrix::user_device> wanted;
  for (auto const& d : devices)
    wanted.push_back(d.first);

  auto const otks = hs_.claim_keys(wanted);

  auto const& me = session_.identity();

  Json::Value room_key;
  room_key["algorithm"]   = Megolm::algorithm;
  room_key["room_id"]     = room_id;
  room_key["session_id"]  = group.session.session_id();
  room_key["session_key"] = group.session.session_key();

  Json::Value messages(Json::objectValue);

  for (auto const& [id, dk] : devices) {
    auto const otk = otks.find(id);
    if (otk == otks.end()) {
      LOG(WARNING) << "no one-time key for " << device_name(id);
      return send_error::stale_key;
    }
    auto const key_id = fmt::format("ed25519:{}", id.second);
    if (!Olm::verify_signed_json(otk->second.json, id.first, key_id,
                                 dk.ed25519)) {
      LOG(WARNING) << "bad one-time key signature from " << device_name(id);
      return send_error::stale_key;
    }

    Json::Value payload;
    payload["type"]                      = "m.room_key";
    payload["content"]                   = room_key;
    payload["sender"]                    = session_.user_id();
    payload["sender_device"]             = session_.device_id();
    payload["keys"]["ed25519"]           = me.ed25519_key();
    payload["recipient"]                 = id.first;
    payload["recipient_keys"]["ed25519"] = dk.ed25519;

    Olm::Message msg;
    try {
      msg = Olm::encrypt(me.account, Base64::dec(dk.curve25519),
                         Base64::dec(otk->second.key),
                         Matrix::canonical_json(payload));
    }
    catch (std::invalid_argument const& e) {
      LOG(WARNING) << "unusable keys for " << device_name(id) << ": "
                   << e.what();
      return send_error::stale_key;
    }

    Json::Value content;
    content["algorithm"]  = Olm::algorithm;
    content["sender_key"] = me.curve25519_key();

    auto& ciphertext   = content["ciphertext"][dk.curve25519];
    ciphertext["type"] = msg.type;
    ciphertext["body"] = msg.body;

    messages[id.first][id.second] = content;
  }

  hs_.send_to_device("m.room.encrypted", messages);

  LOG(INFO) << room_id << ": shared group session " << group.session.session_id()
            << " with " << devices.size() << " devices";
  return {};
}
