#include "Deliver.hpp"

#include <sstream>

#include <glog/logging.h>

#include "FakeHomeserver.hpp"
#include "Megolm.hpp"

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  FakeHomeserver hs;
  Session const  session{"https://example.org", hs.me, hs.access_token,
                        DeviceIdentity{"MYDEV", Olm::Account{}}, "me@host"};
  TrustEveryone const everyone;

  FakeHomeserver::Room room1;
  room1.members[hs.me] = Matrix::membership::invited;
  hs.add_room("!room1:example.org", room1);

  FakeHomeserver::Room secret;
  secret.members[hs.me]              = Matrix::membership::joined;
  secret.members["@bob:example.org"] = Matrix::membership::joined;
  secret.encryption = Matrix::EncryptionSettings{Megolm::algorithm, {}, {}};
  hs.add_room("!secret:example.org", secret);
  hs.add_alias("#secret:example.org", "!secret:example.org");
  hs.add_device("@bob:example.org", "BOB1");

  auto const msg = compose("hello\n~ignored\nworld\n", "hi");

  // One good, one bad address.
  {
    auto const out = deliver(hs, session, everyone, msg,
                             {"!room1:example.org", "@bob:example.org"}, 4);
    CHECK_EQ(out.size(), 2u);
    CHECK(out[0].sent());
    CHECK(!out[1].sent());
    CHECK(out[1].resolve == resolve_error::unsupported_address_form);

    std::ostringstream os;
    CHECK_EQ(report(os, out), 1);
    CHECK_EQ(os.str(), "!room1:example.org: sent\n"
                       "@bob:example.org: UnsupportedAddressForm\n");

    auto const sent = hs.sent();
    CHECK_EQ(sent.size(), 1u);
    CHECK_EQ(sent[0].type, "m.room.message");
    CHECK_EQ(sent[0].content["body"].asString(), "hi\n\nhello\nworld\n");
  }

  // Every address delivered; a room named twice is joined once, sent twice.
  {
    FakeHomeserver::Room room2;
    room2.members[hs.me] = Matrix::membership::invited;
    hs.add_room("!room2:example.org", room2);

    auto const out = deliver(
        hs, session, everyone, msg,
        {"!room2:example.org", "#secret:example.org", "!room2:example.org",
         "!secret:example.org"},
        2);

    std::ostringstream os;
    CHECK_EQ(report(os, out), 0);
    CHECK_EQ(os.str(), "!room2:example.org: sent\n"
                       "#secret:example.org: sent\n"
                       "!room2:example.org: sent\n"
                       "!secret:example.org: sent\n");
    CHECK_EQ(hs.room("!room2:example.org").joins, 1);
    CHECK_EQ(hs.sent().size(), 5u);

    // One group session per room per run.
    CHECK_EQ(hs.to_device().size(), 1u);
  }

  // A failed send for one room leaves the others alone.
  {
    hs.fail_next("send_event", Matrix::failure::rate_limited);
    auto const out = deliver(hs, session, everyone, msg,
                             {"!room1:example.org"}, 1);
    CHECK(out[0].send == send_error::rate_limited);
    CHECK_EQ(out[0].status(), "RateLimited");

    auto const more = deliver(hs, session, everyone, msg,
                              {"!nowhere:example.org", "!room1:example.org",
                               "#gone:example.org"},
                              3);
    CHECK(more[0].resolve == resolve_error::join_denied);
    CHECK(more[1].sent());
    CHECK(more[2].resolve == resolve_error::alias_not_found);

    std::ostringstream os;
    CHECK_EQ(report(os, more), 1);
  }

  // Nothing to do is success.
  {
    std::ostringstream os;
    CHECK_EQ(report(os, deliver(hs, session, everyone, msg, {}, 4)), 0);
    CHECK(os.str().empty());
  }
}
