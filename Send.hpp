#ifndef SEND_DOT_HPP
#define SEND_DOT_HPP

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "Errors.hpp"
#include "Matrix.hpp"
#include "Megolm.hpp"
#include "Rooms.hpp"
#include "Session.hpp"
#include "Trust.hpp"

namespace Config {
auto constexpr rotation_msgs   = 100;
auto constexpr rotation_period = 7 * 24 * 60 * 60; // seconds
} // namespace Config

// Delivers text into resolved rooms, encrypting where the room asks for
// it.  Each room keeps one outbound group session for the life of the
// Sender; all work on a room is serialised, different rooms proceed in
// parallel.
class Sender {
public:
  Sender(Matrix::Homeserver& hs, Session const& session, TrustPolicy const& trust);

  // nullopt once the event is accepted by the homeserver.  A stale_key
  // failure is retried once with a new group session.
  std::optional<send_error> send(RoomHandle const& room, std::string const& body);

  // The group session in use for room_id, if any; for inspection.
  std::optional<std::string> session_id(std::string const& room_id);

private:
  using recipients = std::map<Matrix::user_device, Matrix::DeviceKeys>;

  // The devices a session was shared with, and their Curve25519 and
  // Ed25519 keys.
  using fingerprint
      = std::map<Matrix::user_device, std::pair<std::string, std::string>>;

  struct Group {
    Megolm::OutboundSession session;
    fingerprint             shared_with;
  };

  struct Room {
    std::mutex             mtx;
    std::unique_ptr<Group> group;
  };

  std::shared_ptr<Room> room_(std::string const& room_id);

  std::optional<send_error> attempt_(RoomHandle const& handle,
                                     Room&             room,
                                     std::string const& body,
                                     bool               force_rotation);

  std::optional<send_error> send_plain_(RoomHandle const&  handle,
                                        std::string const& body);

  recipients find_recipients_(std::string const& room_id);

  bool rotation_due_(RoomHandle const& handle,
                     Group const&      group,
                     fingerprint const& devices) const;

  // Make a new group session and hand its key to every recipient.
  // Throws Matrix::Error; returns stale_key on unusable one-time keys.
  std::optional<send_error> share_(std::string const& room_id,
                                   Group&             group,
                                   recipients const&  devices);

  Matrix::Homeserver& hs_;
  Session const&      session_;
  TrustPolicy const&  trust_;

  std::mutex                                   mtx_;
  std::map<std::string, std::shared_ptr<Room>> rooms_;
};

#endif // SEND_DOT_HPP
