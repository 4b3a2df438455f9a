#ifndef ROOMS_DOT_HPP
#define ROOMS_DOT_HPP

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>

#include "Errors.hpp"
#include "Matrix.hpp"
#include "Session.hpp"

// A room we are joined to and ready to send into.
struct RoomHandle {
  std::string address; // as given
  std::string room_id;

  Matrix::membership membership{Matrix::membership::none};

  // Set when the room has an m.room.encryption state event.
  std::optional<Matrix::EncryptionSettings> encryption;

  bool joined_now{false}; // this resolve did the join

  bool encryption_required() const { return encryption.has_value(); }
};

// Turns recipient addresses into joined rooms, joining each room at most
// once per process.  Safe to call from several threads.
class RoomResolver {
public:
  RoomResolver(Matrix::Homeserver& hs, Session const& session);

  std::variant<RoomHandle, resolve_error> resolve(std::string const& address);

private:
  struct Entry {
    std::mutex                mtx;
    std::optional<RoomHandle> handle;
  };

  std::shared_ptr<Entry> entry_(std::string const& room_id);

  std::variant<RoomHandle, resolve_error>
  join_(std::string const& address, std::string const& room_id);

  Matrix::Homeserver& hs_;
  Session const&      session_;

  std::mutex                                    mtx_;
  std::map<std::string, std::shared_ptr<Entry>> rooms_;
};

#endif // ROOMS_DOT_HPP
