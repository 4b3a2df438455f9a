#include "Rooms.hpp"

#include <thread>
#include <vector>

#include <glog/logging.h>

#include "FakeHomeserver.hpp"
#include "Megolm.hpp"

namespace {
resolve_error failed(std::variant<RoomHandle, resolve_error> const& r)
{
  CHECK(std::holds_alternative<resolve_error>(r));
  return std::get<resolve_error>(r);
}

RoomHandle resolved(std::variant<RoomHandle, resolve_error> const& r)
{
  CHECK(std::holds_alternative<RoomHandle>(r))
      << std::get<resolve_error>(r);
  return std::get<RoomHandle>(r);
}
} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  FakeHomeserver hs;

  Session const session{"https://example.org", hs.me, hs.access_token,
                        DeviceIdentity{"MYDEV", Olm::Account{}}, "me@host"};

  auto const invited = Matrix::membership::invited;
  auto const joined  = Matrix::membership::joined;

  FakeHomeserver::Room room1;
  room1.members[hs.me] = invited;
  hs.add_room("!room1:example.org", room1);
  hs.add_alias("#lobby:example.org", "!room1:example.org");

  FakeHomeserver::Room home;
  home.members[hs.me] = joined;
  home.encryption     = Matrix::EncryptionSettings{Megolm::algorithm, {}, {}};
  hs.add_room("!home:example.org", home);

  FakeHomeserver::Room closed;
  closed.join_denied = true;
  hs.add_room("!closed:example.org", closed);

  hs.add_room("!public:example.org", FakeHomeserver::Room{});

  RoomResolver res{hs, session};

  // Invited: the invite is accepted once.
  auto const r1 = resolved(res.resolve("!room1:example.org"));
  CHECK_EQ(r1.room_id, "!room1:example.org");
  CHECK(r1.membership == joined);
  CHECK(r1.joined_now);
  CHECK(!r1.encryption_required());
  CHECK_EQ(hs.room("!room1:example.org").joins, 1);

  // The same room again, by ID and by alias.
  auto const r2 = resolved(res.resolve("!room1:example.org"));
  CHECK(!r2.joined_now);
  CHECK(r2.membership == joined);
  auto const r3 = resolved(res.resolve("#lobby:example.org"));
  CHECK_EQ(r3.address, "#lobby:example.org");
  CHECK_EQ(r3.room_id, "!room1:example.org");
  CHECK(!r3.joined_now);
  CHECK_EQ(hs.room("!room1:example.org").joins, 1);
  CHECK_EQ(hs.calls("get_membership"), 1);

  // Already joined: nothing to do, encryption noticed.
  auto const h = resolved(res.resolve("!home:example.org"));
  CHECK(!h.joined_now);
  CHECK(h.encryption_required());
  CHECK_EQ(h.encryption->algorithm, Megolm::algorithm);
  CHECK_EQ(hs.room("!home:example.org").joins, 0);

  // Not a member, not invited, but allowed in.
  auto const p = resolved(res.resolve("!public:example.org"));
  CHECK(p.joined_now);
  CHECK_EQ(hs.room("!public:example.org").joins, 1);

  CHECK(failed(res.resolve("!closed:example.org"))
        == resolve_error::join_denied);
  CHECK(failed(res.resolve("!nowhere:example.org"))
        == resolve_error::join_denied);
  CHECK(failed(res.resolve("#nothing:example.org"))
        == resolve_error::alias_not_found);
  CHECK(failed(res.resolve("@bob:example.org"))
        == resolve_error::unsupported_address_form);
  CHECK(failed(res.resolve("bob@example.org"))
        == resolve_error::unsupported_address_form);
  CHECK(failed(res.resolve("")) == resolve_error::unsupported_address_form);

  // Network trouble is reported and not remembered.
  FakeHomeserver::Room later;
  later.members[hs.me] = invited;
  hs.add_room("!later:example.org", later);
  hs.add_alias("#later:example.org", "!later:example.org");

  hs.fail_next("resolve_alias", Matrix::failure::network);
  CHECK(failed(res.resolve("#later:example.org")) == resolve_error::unreachable);
  hs.fail_next("join", Matrix::failure::network);
  CHECK(failed(res.resolve("#later:example.org")) == resolve_error::unreachable);
  hs.fail_next("get_membership", Matrix::failure::rate_limited);
  CHECK(failed(res.resolve("!later:example.org")) == resolve_error::unreachable);
  CHECK_EQ(hs.room("!later:example.org").joins, 0);

  auto const l = resolved(res.resolve("#later:example.org"));
  CHECK(l.joined_now);
  CHECK_EQ(hs.room("!later:example.org").joins, 1);

  // Many senders for one room: still a single join.
  FakeHomeserver::Room busy;
  busy.members[hs.me] = invited;
  hs.add_room("!busy:example.org", busy);

  std::vector<std::thread> threads;
  std::vector<int>         ok(8, 0);
  for (auto i = 0u; i < ok.size(); ++i) {
    threads.emplace_back([&res, &ok, i] {
      auto const r = res.resolve("!busy:example.org");
      ok[i] = std::holds_alternative<RoomHandle>(r) ? 1 : 0;
    });
  }
  for (auto& t : threads)
    t.join();
  for (auto v : ok)
    CHECK_EQ(v, 1);
  CHECK_EQ(hs.room("!busy:example.org").joins, 1);
}
