#include "Send.hpp"

#include <set>
#include <thread>
#include <vector>

#include <glog/logging.h>

#include "FakeHomeserver.hpp"
#include "Olm.hpp"

namespace {
auto const joined = Matrix::membership::joined;

RoomHandle encrypted_room(FakeHomeserver& hs,
                          std::string const& room_id,
                          Matrix::EncryptionSettings enc
                          = Matrix::EncryptionSettings{Megolm::algorithm, {}, {}})
{
  FakeHomeserver::Room room;
  room.members[hs.me]               = joined;
  room.members["@bob:example.org"]  = joined;
  room.encryption                   = enc;
  hs.add_room(room_id, room);

  RoomHandle h;
  h.address    = room_id;
  h.room_id    = room_id;
  h.membership = joined;
  h.encryption = enc;
  return h;
}

class DistrustDevice : public TrustPolicy {
public:
  explicit DistrustDevice(std::string device_id)
    : device_id_(std::move(device_id))
  {
  }

  trust decide(Matrix::DeviceKeys const& device) const override
  {
    return device.device_id == device_id_ ? trust::untrusted : trust::trusted;
  }

private:
  std::string device_id_;
};
} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  TrustEveryone const everyone;

  // Plaintext.
  {
    FakeHomeserver hs;
    Session const  session{"https://example.org", hs.me, hs.access_token,
                          DeviceIdentity{"MYDEV", Olm::Account{}}, "me@host"};

    FakeHomeserver::Room room;
    room.members[hs.me] = joined;
    hs.add_room("!room1:example.org", room);

    RoomHandle h;
    h.address    = "!room1:example.org";
    h.room_id    = "!room1:example.org";
    h.membership = joined;

    Sender snd{hs, session, everyone};
    CHECK(!snd.send(h, "hi\n\nhello\nworld\n"));

    auto const sent = hs.sent();
    CHECK_EQ(sent.size(), 1u);
    CHECK_EQ(sent[0].room_id, "!room1:example.org");
    CHECK_EQ(sent[0].type, "m.room.message");
    CHECK_EQ(sent[0].content["msgtype"].asString(), "m.text");
    CHECK_EQ(sent[0].content["body"].asString(), "hi\n\nhello\nworld\n");
    CHECK_EQ(hs.calls("query_keys"), 0);

    // Failures map onto the send taxonomy, none retried.
    struct {
      Matrix::failure f;
      send_error      e;
    } const cases[]{
        {Matrix::failure::network, send_error::network_failure},
        {Matrix::failure::unauthorized, send_error::unauthorized},
        {Matrix::failure::forbidden, send_error::unauthorized},
        {Matrix::failure::rate_limited, send_error::rate_limited},
        {Matrix::failure::rejected, send_error::rejected},
        {Matrix::failure::not_found, send_error::rejected},
    };
    for (auto const& c : cases) {
      auto const before = hs.calls("send_event");
      hs.fail_next("send_event", c.f);
      auto const err = snd.send(h, "x");
      CHECK(err == c.e) << c.f;
      CHECK_EQ(hs.calls("send_event"), before + 1);
    }
    CHECK_EQ(hs.sent().size(), 1u);
  }

  // Encrypted: keys shared once, to every device but ours.
  {
    FakeHomeserver hs;
    DeviceIdentity me{"MYDEV", Olm::Account{}};
    auto const     my_curve = me.curve25519_key();
    Session const  session{"https://example.org", hs.me, hs.access_token,
                          std::move(me), "me@host"};

    hs.add_device("@bob:example.org", "BOB1");
    hs.add_device("@bob:example.org", "BOB2");
    hs.add_device(hs.me, "MYDEV");
    hs.add_device(hs.me, "LAPTOP");

    auto const h = encrypted_room(hs, "!secret:example.org");

    Sender snd{hs, session, everyone};
    CHECK(!snd.session_id(h.room_id));
    CHECK(!snd.send(h, "hi\n\nhello\nworld\n"));

    auto const sid = snd.session_id(h.room_id);
    CHECK(sid);

    auto const td = hs.to_device();
    CHECK_EQ(td.size(), 1u);
    CHECK_EQ(td[0].type, "m.room.encrypted");
    auto const& msgs = td[0].messages;
    CHECK_EQ(msgs.size(), 2u);
    CHECK_EQ(msgs["@bob:example.org"].size(), 2u);
    CHECK_EQ(msgs[hs.me].size(), 1u);
    CHECK(msgs[hs.me].isMember("LAPTOP"));
    CHECK(!msgs[hs.me].isMember("MYDEV"));

    auto const& bob1 = hs.device("@bob:example.org", "BOB1");
    auto const  for_bob1 = msgs["@bob:example.org"]["BOB1"];
    CHECK_EQ(for_bob1["algorithm"].asString(), Olm::algorithm);
    CHECK_EQ(for_bob1["sender_key"].asString(), my_curve);
    auto const& ct = for_bob1["ciphertext"][bob1.account.curve25519_key()];
    CHECK_EQ(ct["type"].asInt(), 0);
    CHECK(!ct["body"].asString().empty());
    CHECK_EQ(hs.device("@bob:example.org", "BOB1").one_time_keys.size(), 4u);

    auto sent = hs.sent();
    CHECK_EQ(sent.size(), 1u);
    CHECK_EQ(sent[0].type, "m.room.encrypted");
    auto const& c = sent[0].content;
    CHECK_EQ(c["algorithm"].asString(), Megolm::algorithm);
    CHECK_EQ(c["session_id"].asString(), *sid);
    CHECK_EQ(c["sender_key"].asString(), my_curve);
    CHECK_EQ(c["device_id"].asString(), "MYDEV");
    CHECK(!c.isMember("body"));
    CHECK(c["ciphertext"].asString().find("hello") == std::string::npos);

    // Same devices: the session is reused, no new key delivery.
    CHECK(!snd.send(h, "again"));
    CHECK_EQ(hs.to_device().size(), 1u);
    CHECK_EQ(*snd.session_id(h.room_id), *sid);
    CHECK_EQ(hs.sent().size(), 2u);

    // A new device: rotate and share again.
    hs.add_device("@bob:example.org", "BOB3");
    CHECK(!snd.send(h, "third"));
    CHECK_EQ(hs.to_device().size(), 2u);
    CHECK_NE(*snd.session_id(h.room_id), *sid);
    CHECK_EQ(hs.to_device()[1].messages["@bob:example.org"].size(), 3u);

    // A device going away rotates too.
    auto const sid3 = *snd.session_id(h.room_id);
    hs.remove_device("@bob:example.org", "BOB2");
    CHECK(!snd.send(h, "fourth"));
    CHECK_NE(*snd.session_id(h.room_id), sid3);
    CHECK_EQ(hs.to_device().size(), 3u);

    // Key delivery failing leaves the room with no session.
    hs.add_device("@bob:example.org", "BOB4");
    hs.fail_next("send_to_device", Matrix::failure::network);
    CHECK(snd.send(h, "fifth") == send_error::network_failure);
    CHECK(!snd.session_id(h.room_id));
    CHECK_EQ(hs.sent().size(), 4u);

    CHECK(!snd.send(h, "fifth"));
    CHECK(snd.session_id(h.room_id));
    CHECK_EQ(hs.sent().size(), 5u);
  }

  // Rotation by message count and by age.
  {
    FakeHomeserver hs;
    Session const  session{"https://example.org", hs.me, hs.access_token,
                          DeviceIdentity{"MYDEV", Olm::Account{}}, "me@host"};
    hs.add_device("@bob:example.org", "BOB1", 20);

    auto const by_count = encrypted_room(
        hs, "!count:example.org",
        Matrix::EncryptionSettings{Megolm::algorithm, {}, 2});

    Sender snd{hs, session, everyone};
    for (auto i = 0; i < 5; ++i)
      CHECK(!snd.send(by_count, "m"));
    // Sessions carry messages 1-2, 3-4 and 5.
    CHECK_EQ(hs.to_device().size(), 3u);

    auto const by_age = encrypted_room(
        hs, "!age:example.org",
        Matrix::EncryptionSettings{Megolm::algorithm, 0, {}});
    for (auto i = 0; i < 3; ++i)
      CHECK(!snd.send(by_age, "m"));
    CHECK_EQ(hs.to_device().size(), 6u);
  }

  // Stale keys: one rotation, one retry.
  {
    FakeHomeserver hs;
    Session const  session{"https://example.org", hs.me, hs.access_token,
                          DeviceIdentity{"MYDEV", Olm::Account{}}, "me@host"};

    // A tampered first one-time key, a good second one.
    auto&      bob = hs.add_device("@bob:example.org", "BOB1", 2);
    auto const other = Olm::Account{};
    bob.one_time_keys.front()["key"] = other.curve25519_key();

    auto const h = encrypted_room(hs, "!stale:example.org");

    Sender snd{hs, session, everyone};
    CHECK(!snd.send(h, "made it"));
    CHECK_EQ(hs.calls("claim_keys"), 2);
    CHECK_EQ(hs.to_device().size(), 1u);
    CHECK_EQ(hs.sent().size(), 1u);

    // No keys left at all: reported after the single retry.
    hs.add_device("@bob:example.org", "BOB2", 0);
    CHECK(snd.send(h, "lost") == send_error::stale_key);
    CHECK_EQ(hs.calls("claim_keys"), 4);
    CHECK_EQ(hs.sent().size(), 1u);
    CHECK(!snd.session_id(h.room_id));
  }

  // Devices left out: bad self-signature, untrusted.
  {
    FakeHomeserver hs;
    Session const  session{"https://example.org", hs.me, hs.access_token,
                          DeviceIdentity{"MYDEV", Olm::Account{}}, "me@host"};

    hs.add_device("@bob:example.org", "GOOD");
    hs.add_device("@bob:example.org", "SHADY");
    auto& forged = hs.add_device("@bob:example.org", "FORGED");
    forged.keys["keys"]["curve25519:FORGED"] = Olm::Account{}.curve25519_key();

    auto const h = encrypted_room(hs, "!picky:example.org");

    DistrustDevice const policy{"SHADY"};
    Sender               snd{hs, session, policy};
    CHECK(!snd.send(h, "for GOOD only"));

    auto const td = hs.to_device();
    CHECK_EQ(td.size(), 1u);
    auto const& bob = td[0].messages["@bob:example.org"];
    CHECK_EQ(bob.size(), 1u);
    CHECK(bob.isMember("GOOD"));
    CHECK_EQ(hs.calls("claim_keys"), 1);
  }

  // Signatures that aren't objects: the device is skipped, the room still
  // gets its message.
  {
    FakeHomeserver hs;
    Session const  session{"https://example.org", hs.me, hs.access_token,
                          DeviceIdentity{"MYDEV", Olm::Account{}}, "me@host"};

    hs.add_device("@bob:example.org", "GOOD");
    auto& junk = hs.add_device("@bob:example.org", "JUNK");
    junk.keys["signatures"] = "junk";
    auto& odd = hs.add_device("@bob:example.org", "ODD");
    odd.keys["signatures"]["@bob:example.org"] = 7;

    auto const h = encrypted_room(hs, "!junk:example.org");

    Sender snd{hs, session, everyone};
    CHECK(!snd.send(h, "hello"));

    auto const td = hs.to_device();
    CHECK_EQ(td.size(), 1u);
    auto const& bob = td[0].messages["@bob:example.org"];
    CHECK_EQ(bob.size(), 1u);
    CHECK(bob.isMember("GOOD"));
    CHECK_EQ(hs.sent().size(), 1u);
  }

  // Same fault on a claimed one-time key: treated as stale, the next key
  // is used.
  {
    FakeHomeserver hs;
    Session const  session{"https://example.org", hs.me, hs.access_token,
                          DeviceIdentity{"MYDEV", Olm::Account{}}, "me@host"};

    auto& bob = hs.add_device("@bob:example.org", "BOB1", 2);
    bob.one_time_keys.front()["signatures"] = "junk";

    auto const h = encrypted_room(hs, "!junkotk:example.org");

    Sender snd{hs, session, everyone};
    CHECK(!snd.send(h, "made it"));
    CHECK_EQ(hs.calls("claim_keys"), 2);
    CHECK_EQ(hs.to_device().size(), 1u);
    CHECK_EQ(hs.sent().size(), 1u);
  }

  // Alone in a room: nothing to share, still encrypted.
  {
    FakeHomeserver hs;
    Session const  session{"https://example.org", hs.me, hs.access_token,
                          DeviceIdentity{"MYDEV", Olm::Account{}}, "me@host"};
    auto const     h = encrypted_room(hs, "!alone:example.org");

    Sender snd{hs, session, everyone};
    CHECK(!snd.send(h, "note to self"));
    CHECK_EQ(hs.to_device().size(), 0u);
    CHECK_EQ(hs.calls("claim_keys"), 0);
    CHECK_EQ(hs.sent().size(), 1u);
    CHECK_EQ(hs.sent()[0].type, "m.room.encrypted");
  }

  // An algorithm we don't speak: nothing goes out in the clear.
  {
    FakeHomeserver hs;
    Session const  session{"https://example.org", hs.me, hs.access_token,
                          DeviceIdentity{"MYDEV", Olm::Account{}}, "me@host"};
    auto const     h = encrypted_room(
        hs, "!future:example.org",
        Matrix::EncryptionSettings{"m.megolm.v2.aes-sha2", {}, {}});

    Sender snd{hs, session, everyone};
    CHECK(snd.send(h, "x") == send_error::unsupported_encryption);
    CHECK(hs.sent().empty());
  }

  // Many sends to one room at once share one session.
  {
    FakeHomeserver hs;
    Session const  session{"https://example.org", hs.me, hs.access_token,
                          DeviceIdentity{"MYDEV", Olm::Account{}}, "me@host"};
    hs.add_device("@bob:example.org", "BOB1");
    auto const h = encrypted_room(hs, "!busy:example.org");

    Sender                   snd{hs, session, everyone};
    std::vector<std::thread> threads;
    for (auto i = 0; i < 4; ++i) {
      threads.emplace_back([&snd, &h] {
        for (auto j = 0; j < 5; ++j)
          CHECK(!snd.send(h, "busy"));
      });
    }
    for (auto& t : threads)
      t.join();

    CHECK_EQ(hs.to_device().size(), 1u);
    auto const sent = hs.sent();
    CHECK_EQ(sent.size(), 20u);
    std::set<std::string> ciphertexts;
    for (auto const& e : sent)
      ciphertexts.insert(e.content["ciphertext"].asString());
    CHECK_EQ(ciphertexts.size(), 20u);
  }
}
