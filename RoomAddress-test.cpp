#include "RoomAddress.hpp"

#include <stdexcept>

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  RoomAddress room{"!room1:example.org"};
  CHECK(room.kind() == RoomAddress::form::room_id);
  CHECK_EQ(room.localpart(), "room1");
  CHECK_EQ(room.server(), "example.org");
  CHECK_EQ(room.as_string(), "!room1:example.org");
  CHECK(room.sendable());

  RoomAddress alias{"#mail-log:matrix.example.com:8448"};
  CHECK(alias.kind() == RoomAddress::form::alias);
  CHECK_EQ(alias.localpart(), "mail-log");
  CHECK_EQ(alias.server(), "matrix.example.com:8448");
  CHECK_EQ(alias.as_string(), "#mail-log:matrix.example.com:8448");

  RoomAddress user{"@alice:example.org"};
  CHECK(user.kind() == RoomAddress::form::user_id);
  CHECK(!user.sendable());
  CHECK_EQ(std::string(form_name(user.kind())), "user ID");

  CHECK(RoomAddress::validate("!OGEhHVWSdvArJzumhm:matrix.org"));
  CHECK(RoomAddress::validate("#caf\xC3\xA9:example.org"));
  CHECK(RoomAddress::validate("!x:[::1]:8448"));
  CHECK(RoomAddress::validate("!x:127.0.0.1"));

  for (auto bad : {"", "room1", "room1:example.org", "!room1", "!:example.org",
                   "#a b:example.org", "!x:", "$event:example.org",
                   "!x:example.org:", "!x:exa mple.org", "mailto:a@b"}) {
    CHECK(!RoomAddress::validate(bad)) << bad;
    auto threw = false;
    try {
      RoomAddress a{bad};
    }
    catch (std::invalid_argument const&) {
      threw = true;
    }
    CHECK(threw) << bad;
  }
}
