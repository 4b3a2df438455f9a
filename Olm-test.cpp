#include "Olm.hpp"

#include <map>
#include <stdexcept>

#include <glog/logging.h>

#include "Base64.hpp"
#include "Crypto.hpp"

namespace {
// Split a protobuf-style message into its fields.
std::map<int, std::string> fields(std::string_view msg)
{
  std::map<int, std::string> out;
  auto                       varint = [&msg]() {
    uint64_t v     = 0;
    int      shift = 0;
    for (;;) {
      CHECK(!msg.empty());
      auto const b = static_cast<unsigned char>(msg.front());
      msg.remove_prefix(1);
      v |= static_cast<uint64_t>(b & 0x7f) << shift;
      if ((b & 0x80) == 0)
        return v;
      shift += 7;
    }
  };
  while (!msg.empty()) {
    auto const tag = static_cast<unsigned char>(msg.front());
    msg.remove_prefix(1);
    if ((tag & 7) == 0) {
      out[tag] = std::to_string(varint());
    }
    else {
      CHECK_EQ(tag & 7, 2);
      auto const len = varint();
      CHECK_LE(len, msg.size());
      out[tag] = std::string(msg.substr(0, len));
      msg.remove_prefix(len);
    }
  }
  return out;
}
} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  auto const user   = std::string("@alice:example.org");
  auto const device = std::string("ALICEDEV");

  Olm::Account alice;
  CHECK_EQ(alice.curve25519_key().size(), 43u);
  CHECK_EQ(alice.ed25519_key().size(), 43u);

  // Device keys are self-signed.
  auto const dk = alice.device_keys(user, device);
  CHECK_EQ(dk["user_id"].asString(), user);
  CHECK_EQ(dk["device_id"].asString(), device);
  CHECK_EQ(dk["keys"]["curve25519:ALICEDEV"].asString(), alice.curve25519_key());
  CHECK(Olm::verify_signed_json(dk, user, "ed25519:ALICEDEV",
                                alice.ed25519_key()));

  auto tampered                        = dk;
  tampered["keys"]["curve25519:ALICEDEV"] = Olm::Account{}.curve25519_key();
  CHECK(!Olm::verify_signed_json(tampered, user, "ed25519:ALICEDEV",
                                 alice.ed25519_key()));
  CHECK(!Olm::verify_signed_json(dk, user, "ed25519:OTHER",
                                 alice.ed25519_key()));
  CHECK(!Olm::verify_signed_json(dk, user, "ed25519:ALICEDEV",
                                 Olm::Account{}.ed25519_key()));

  // Whatever shape the server sends, it's just not a signature.
  auto junk          = dk;
  junk["signatures"] = "junk";
  CHECK(!Olm::verify_signed_json(junk, user, "ed25519:ALICEDEV",
                                 alice.ed25519_key()));
  junk["signatures"]       = Json::Value{Json::objectValue};
  junk["signatures"][user] = Json::Value{Json::arrayValue};
  junk["signatures"][user].append("sig");
  CHECK(!Olm::verify_signed_json(junk, user, "ed25519:ALICEDEV",
                                 alice.ed25519_key()));
  junk["signatures"][user] = 7;
  CHECK(!Olm::verify_signed_json(junk, user, "ed25519:ALICEDEV",
                                 alice.ed25519_key()));
  CHECK(!Olm::verify_signed_json(Json::Value{"a string"}, user,
                                 "ed25519:ALICEDEV", alice.ed25519_key()));

  // Unsigned data is outside the signature.
  auto annotated                          = dk;
  annotated["unsigned"]["device_display_name"] = "laptop";
  CHECK(Olm::verify_signed_json(annotated, user, "ed25519:ALICEDEV",
                                alice.ed25519_key()));

  auto const otks = alice.generate_one_time_keys(3, user, device);
  CHECK_EQ(otks.size(), 3u);
  CHECK_EQ(alice.one_time_key_count(), 3u);
  CHECK(otks.isMember("signed_curve25519:AAAAAQ"));
  for (auto const& id : otks.getMemberNames()) {
    CHECK(Olm::verify_signed_json(otks[id], user, "ed25519:ALICEDEV",
                                  alice.ed25519_key()));
  }
  auto const more = alice.generate_one_time_keys(2, user, device);
  CHECK(more.isMember("signed_curve25519:AAAABA"));
  CHECK(more.isMember("signed_curve25519:AAAABQ"));

  // Persistence keeps every key.
  auto const restored = Olm::Account::from_json(alice.to_json());
  CHECK(restored);
  CHECK_EQ(restored->curve25519_key(), alice.curve25519_key());
  CHECK_EQ(restored->ed25519_key(), alice.ed25519_key());
  CHECK_EQ(restored->one_time_key_count(), 5u);
  CHECK_EQ(restored->sign("x"), alice.sign("x"));

  CHECK(!Olm::Account::from_json(Json::Value{}));
  auto broken          = alice.to_json();
  broken["curve25519"] = "not base64!";
  CHECK(!Olm::Account::from_json(broken));
  broken               = alice.to_json();
  broken["ed25519"]    = Base64::enc("short");
  CHECK(!Olm::Account::from_json(broken));

  // Encrypt to Bob and decrypt on his side.
  Crypto::Curve25519 bob_identity;
  Crypto::Curve25519 bob_otk;

  auto const plaintext = std::string(R"({"type":"m.room_key"})");
  auto const m = Olm::encrypt(alice, bob_identity.public_key(),
                              bob_otk.public_key(), plaintext);
  CHECK_EQ(m.type, 0);

  auto const raw = Base64::dec(m.body);
  CHECK_EQ(raw[0], '\x03');
  auto pre_key = fields(std::string_view(raw).substr(1));
  CHECK_EQ(pre_key[0x0A], bob_otk.public_key());
  CHECK_EQ(pre_key[0x1A], alice.identity().public_key());
  auto const base_key = pre_key[0x12];
  auto const inner    = pre_key[0x22];

  auto const secret = bob_otk.agree(alice.identity().public_key())
                      + bob_identity.agree(base_key)
                      + bob_otk.agree(base_key);
  auto const chain_key
      = Crypto::hkdf_sha256(secret, "", "OLM_ROOT", 64).substr(32);
  auto const message_key = Crypto::hmac_sha256(chain_key, "\x01");
  auto const keys = Crypto::hkdf_sha256(message_key, "", "OLM_KEYS", 80);

  CHECK_EQ(inner[0], '\x03');
  auto const body = inner.substr(0, inner.size() - 8);
  auto const mac  = inner.substr(inner.size() - 8);
  CHECK_EQ(Crypto::hmac_sha256(keys.substr(32, 32), body).substr(0, 8), mac);

  auto msg = fields(std::string_view(body).substr(1));
  CHECK_EQ(msg[0x0A].size(), 32u);
  CHECK_EQ(msg[0x10], "0");
  auto const decrypted = Crypto::aes256_cbc_decrypt(
      keys.substr(0, 32), keys.substr(64, 16), msg[0x22]);
  CHECK(decrypted);
  CHECK_EQ(*decrypted, plaintext);

  // A fresh session each time.
  auto const again = Olm::encrypt(alice, bob_identity.public_key(),
                                  bob_otk.public_key(), plaintext);
  CHECK_NE(again.body, m.body);

  auto threw = false;
  try {
    Olm::encrypt(alice, "short", bob_otk.public_key(), plaintext);
  }
  catch (std::invalid_argument const&) {
    threw = true;
  }
  CHECK(threw);
}
