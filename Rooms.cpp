#include "Rooms.hpp"

#include <stdexcept>

#include <glog/logging.h>

#include "RoomAddress.hpp"

namespace {
bool transient(Matrix::failure f)
{
  return f == Matrix::failure::network || f == Matrix::failure::rate_limited;
}
} // namespace

RoomResolver::RoomResolver(Matrix::Homeserver& hs, Session const& session)
  : hs_(hs)
  , session_(session)
{
}

std::shared_ptr<RoomResolver::Entry>
RoomResolver::entry_(std::string const& room_id)
{
  std::lock_guard<std::mutex> lock(mtx_);
  auto& e = rooms_[room_id];
  if (!e)
    e = std::make_shared<Entry>();
  return e;
}

std::variant<RoomHandle, resolve_error>
RoomResolver::resolve(std::string const& address)
{
  RoomAddress addr;
  try {
    addr = RoomAddress{address};
  }
  catch (std::invalid_argument const& e) {
    LOG(WARNING) << e.what();
    return resolve_error::unsupported_address_form;
  }
  if (!addr.sendable()) {
    LOG(WARNING) << "can't send to a " << form_name(addr.kind()) << ": "
                 << address;
    return resolve_error::unsupported_address_form;
  }

  auto room_id = address;
  if (addr.kind() == RoomAddress::form::alias) {
    try {
      room_id = hs_.resolve_alias(address);
    }
    catch (Matrix::Error const& e) {
      LOG(WARNING) << "alias " << address << ": " << e.what();
      if (transient(e.kind()))
        return resolve_error::unreachable;
      return resolve_error::alias_not_found;
    }
    LOG(INFO) << address << " is " << room_id;
  }

  auto const e = entry_(room_id);

  // Everything after the alias lookup is done once per room.
  std::lock_guard<std::mutex> lock(e->mtx);
  if (e->handle) {
    auto handle       = *e->handle;
    handle.address    = address;
    handle.joined_now = false;
    return handle;
  }

  auto const result = join_(address, room_id);
  if (std::holds_alternative<RoomHandle>(result))
    e->handle = std::get<RoomHandle>(result);
  return result;
}

std::variant<RoomHandle, resolve_error>
RoomResolver::join_(std::string const& address, std::string const& room_id)
{
  RoomHandle handle;
  handle.address = address;
  handle.room_id = room_id;

  try {
    handle.membership = hs_.get_membership(room_id, session_.user_id());
  }
  catch (Matrix::Error const& e) {
    LOG(WARNING) << "membership in " << room_id << ": " << e.what();
    if (transient(e.kind()))
      return resolve_error::unreachable;
    return resolve_error::join_denied;
  }

  if (handle.membership != Matrix::membership::joined) {
    LOG(INFO) << "joining " << room_id << " ("
              << Matrix::membership_name(handle.membership) << ")";
    try {
      auto const joined = hs_.join(room_id);
      if (joined != room_id) {
        LOG(WARNING) << "joined " << joined << " asking for " << room_id;
      }
    }
    catch (Matrix::Error const& e) {
      LOG(WARNING) << "join " << room_id << ": " << e.what();
      if (transient(e.kind()))
        return resolve_error::unreachable;
      return resolve_error::join_denied;
    }
    handle.membership = Matrix::membership::joined;
    handle.joined_now = true;
  }

  try {
    handle.encryption = hs_.get_encryption(room_id);
  }
  catch (Matrix::Error const& e) {
    LOG(WARNING) << "encryption state of " << room_id << ": " << e.what();
    if (transient(e.kind()))
      return resolve_error::unreachable;
    return resolve_error::join_denied;
  }

  return handle;
}
