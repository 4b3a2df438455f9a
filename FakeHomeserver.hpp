#ifndef FAKEHOMESERVER_DOT_HPP
#define FAKEHOMESERVER_DOT_HPP

// An in-memory homeserver for the tests, with real device keys for the
// other users and a way to make the next call of any operation fail.

#include <deque>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include <fmt/format.h>

#include <glog/logging.h>

#include "Matrix.hpp"
#include "Olm.hpp"

class FakeHomeserver : public Matrix::Homeserver {
public:
  struct Room {
    std::map<std::string, Matrix::membership> members;

    std::optional<Matrix::EncryptionSettings> encryption;

    bool join_denied{false};
    int  joins{0};
  };

  struct SentEvent {
    std::string room_id;
    std::string type;
    Json::Value content;
  };

  struct ToDevice {
    std::string type;
    Json::Value messages;
  };

  struct Device {
    std::string  user_id;
    std::string  device_id;
    Olm::Account account;
    Json::Value  keys;      // as queried
    std::deque<Json::Value> one_time_keys;
  };

  std::string me{"@me:example.org"};
  std::string password{"hunter2"};
  std::string access_token{"syt_token"};

  // Fail the next call of op (by name) with this kind.
  void fail_next(std::string const& op, Matrix::failure kind, int times = 1)
  {
    std::lock_guard<std::mutex> lock(mtx_);
    for (auto i = 0; i < times; ++i)
      faults_[op].push_back(kind);
  }

  void add_room(std::string const& room_id, Room room)
  {
    std::lock_guard<std::mutex> lock(mtx_);
    rooms_[room_id] = std::move(room);
  }

  void add_alias(std::string const& alias, std::string const& room_id)
  {
    std::lock_guard<std::mutex> lock(mtx_);
    aliases_[alias] = room_id;
  }

  // A device for user with n one-time keys, properly signed.
  Device& add_device(std::string const& user_id,
                     std::string const& device_id,
                     int                n = 5)
  {
    std::lock_guard<std::mutex> lock(mtx_);
    auto& d     = devices_[{user_id, device_id}];
    d.user_id   = user_id;
    d.device_id = device_id;
    d.keys      = d.account.device_keys(user_id, device_id);
    auto const otks
        = d.account.generate_one_time_keys(n, user_id, device_id);
    for (auto const& id : otks.getMemberNames()) {
      auto k = otks[id];
      k["id"] = id;
      d.one_time_keys.push_back(k);
    }
    return d;
  }

  void remove_device(std::string const& user_id, std::string const& device_id)
  {
    std::lock_guard<std::mutex> lock(mtx_);
    devices_.erase({user_id, device_id});
  }

  Device& device(std::string const& user_id, std::string const& device_id)
  {
    std::lock_guard<std::mutex> lock(mtx_);
    return devices_.at({user_id, device_id});
  }

  Room room(std::string const& room_id)
  {
    std::lock_guard<std::mutex> lock(mtx_);
    return rooms_.at(room_id);
  }

  std::vector<SentEvent> sent()
  {
    std::lock_guard<std::mutex> lock(mtx_);
    return sent_;
  }

  std::vector<ToDevice> to_device()
  {
    std::lock_guard<std::mutex> lock(mtx_);
    return to_device_;
  }

  int calls(std::string const& op)
  {
    std::lock_guard<std::mutex> lock(mtx_);
    return calls_[op];
  }

  Json::Value uploaded_device_keys;
  Json::Value uploaded_one_time_keys;

  // Matrix::Homeserver

  Matrix::LoginResult login(std::string const& user,
                            std::string const& pass,
                            std::string const& device_id,
                            std::string const& display_name) override
  {
    std::lock_guard<std::mutex> lock(mtx_);
    enter_("login");
    if (pass != password) {
      throw Matrix::Error(Matrix::failure::forbidden, 403, "M_FORBIDDEN",
                          "bad password");
    }
    last_display_name = display_name;
    auto const user_id
        = user.front() == '@' ? user : fmt::format("@{}:example.org", user);
    return Matrix::LoginResult{user_id, access_token, device_id};
  }

  std::string last_display_name;

  void upload_keys(Json::Value const& device_keys,
                   Json::Value const& one_time_keys) override
  {
    std::lock_guard<std::mutex> lock(mtx_);
    enter_("upload_keys");
    uploaded_device_keys   = device_keys;
    uploaded_one_time_keys = one_time_keys;
  }

  std::string resolve_alias(std::string const& alias) override
  {
    std::lock_guard<std::mutex> lock(mtx_);
    enter_("resolve_alias");
    auto const it = aliases_.find(alias);
    if (it == aliases_.end()) {
      throw Matrix::Error(Matrix::failure::not_found, 404, "M_NOT_FOUND",
                          "no such alias");
    }
    return it->second;
  }

  Matrix::membership get_membership(std::string const& room_id,
                                    std::string const& user_id) override
  {
    std::lock_guard<std::mutex> lock(mtx_);
    enter_("get_membership");
    // The client reports a 403 or 404 here as no membership.
    auto const r = rooms_.find(room_id);
    if (r == rooms_.end())
      return Matrix::membership::none;
    auto const m = r->second.members.find(user_id);
    return m == r->second.members.end() ? Matrix::membership::none : m->second;
  }

  std::string join(std::string const& room_id_or_alias) override
  {
    std::lock_guard<std::mutex> lock(mtx_);
    enter_("join");
    auto room_id = room_id_or_alias;
    if (auto const a = aliases_.find(room_id); a != aliases_.end())
      room_id = a->second;
    auto const r = rooms_.find(room_id);
    if (r == rooms_.end()) {
      throw Matrix::Error(Matrix::failure::not_found, 404, "M_NOT_FOUND",
                          "no such room");
    }
    if (r->second.join_denied) {
      throw Matrix::Error(Matrix::failure::forbidden, 403, "M_FORBIDDEN",
                          "not invited");
    }
    ++r->second.joins;
    r->second.members[me] = Matrix::membership::joined;
    return room_id;
  }

  std::optional<Matrix::EncryptionSettings>
  get_encryption(std::string const& room_id) override
  {
    std::lock_guard<std::mutex> lock(mtx_);
    enter_("get_encryption");
    return rooms_.at(room_id).encryption;
  }

  std::vector<std::string> joined_members(std::string const& room_id) override
  {
    std::lock_guard<std::mutex> lock(mtx_);
    enter_("joined_members");
    std::vector<std::string> members;
    for (auto const& [user, m] : rooms_.at(room_id).members) {
      if (m == Matrix::membership::joined)
        members.push_back(user);
    }
    return members;
  }

  std::vector<Matrix::DeviceKeys>
  query_keys(std::vector<std::string> const& user_ids) override
  {
    std::lock_guard<std::mutex> lock(mtx_);
    enter_("query_keys");
    std::set<std::string> const       wanted(user_ids.begin(), user_ids.end());
    std::vector<Matrix::DeviceKeys> keys;
    for (auto const& [id, d] : devices_) {
      if (!wanted.count(id.first))
        continue;
      keys.push_back(Matrix::DeviceKeys{
          d.user_id, d.device_id,
          d.keys["keys"][fmt::format("curve25519:{}", d.device_id)].asString(),
          d.keys["keys"][fmt::format("ed25519:{}", d.device_id)].asString(),
          d.keys});
    }
    return keys;
  }

  std::map<Matrix::user_device, Matrix::OneTimeKey>
  claim_keys(std::vector<Matrix::user_device> const& wanted) override
  {
    std::lock_guard<std::mutex> lock(mtx_);
    enter_("claim_keys");
    std::map<Matrix::user_device, Matrix::OneTimeKey> claimed;
    for (auto const& ud : wanted) {
      auto const d = devices_.find(ud);
      if (d == devices_.end() || d->second.one_time_keys.empty())
        continue;
      auto k = d->second.one_time_keys.front();
      d->second.one_time_keys.pop_front();
      auto const id = k["id"].asString();
      k.removeMember("id");
      claimed.emplace(ud, Matrix::OneTimeKey{id, k["key"].asString(), k});
    }
    return claimed;
  }

  void send_to_device(std::string const& event_type,
                      Json::Value const& messages) override
  {
    std::lock_guard<std::mutex> lock(mtx_);
    enter_("send_to_device");
    to_device_.push_back(ToDevice{event_type, messages});
  }

  std::string send_event(std::string const& room_id,
                         std::string const& event_type,
                         Json::Value const& content) override
  {
    std::lock_guard<std::mutex> lock(mtx_);
    enter_("send_event");
    auto const r = rooms_.find(room_id);
    if (r == rooms_.end() || r->second.members[me] != Matrix::membership::joined) {
      throw Matrix::Error(Matrix::failure::forbidden, 403, "M_FORBIDDEN",
                          "not joined");
    }
    sent_.push_back(SentEvent{room_id, event_type, content});
    return fmt::format("$event{}", sent_.size());
  }

private:
  void enter_(std::string const& op)
  {
    ++calls_[op];
    auto& q = faults_[op];
    if (!q.empty()) {
      auto const kind = q.front();
      q.pop_front();
      throw Matrix::Error(kind, 0, "", fmt::format("injected {} failure", op));
    }
  }

  std::mutex mtx_;

  std::map<std::string, Room>                    rooms_;
  std::map<std::string, std::string>             aliases_;
  std::map<Matrix::user_device, Device>          devices_;
  std::map<std::string, std::deque<Matrix::failure>> faults_;
  std::map<std::string, int>                     calls_;

  std::vector<SentEvent> sent_;
  std::vector<ToDevice>  to_device_;
};

#endif // FAKEHOMESERVER_DOT_HPP
