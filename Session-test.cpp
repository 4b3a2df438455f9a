#include "Session.hpp"

#include <stdexcept>

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  Session anon{"https://matrix.org"};
  CHECK(!anon.authenticated());
  CHECK_EQ(anon.device_id(), "");
  CHECK_EQ(anon.homeserver(), "https://matrix.org");

  DeviceIdentity identity{"LAPTOP", Olm::Account{}};
  Session        s{"https://matrix.org", "@me:matrix.org", "tok", identity,
            "me@laptop"};
  CHECK(s.authenticated());
  CHECK_EQ(s.device_id(), "LAPTOP");
  CHECK_EQ(s.identity().curve25519_key(), identity.curve25519_key());
  CHECK_EQ(s.device_display_name(), "me@laptop");

  // Never half logged in.
  auto threw = false;
  try {
    Session{"https://matrix.org", "@me:matrix.org", "tok",
            DeviceIdentity{"", Olm::Account{}}, ""};
  }
  catch (std::invalid_argument const&) {
    threw = true;
  }
  CHECK(threw);

  threw = false;
  try {
    Session{"https://matrix.org", "@me:matrix.org", "", identity, ""};
  }
  catch (std::invalid_argument const&) {
    threw = true;
  }
  CHECK(threw);

  auto const restored = Session::from_json(s.to_json());
  CHECK(restored);
  CHECK_EQ(restored->homeserver(), s.homeserver());
  CHECK_EQ(restored->user_id(), s.user_id());
  CHECK_EQ(restored->access_token(), s.access_token());
  CHECK_EQ(restored->device_id(), s.device_id());
  CHECK_EQ(restored->device_display_name(), s.device_display_name());
  CHECK_EQ(restored->identity().ed25519_key(), s.identity().ed25519_key());

  auto partial         = s.to_json();
  partial["device_id"] = "";
  CHECK(!Session::from_json(partial));

  auto no_keys = s.to_json();
  no_keys.removeMember("account");
  CHECK(!Session::from_json(no_keys));

  auto missing = s.to_json();
  missing.removeMember("user_id");
  CHECK(!Session::from_json(missing));

  CHECK(!Session::from_json(Json::Value{"a string"}));

  auto const anon_back = Session::from_json(anon.to_json());
  CHECK(anon_back);
  CHECK(!anon_back->authenticated());
}
