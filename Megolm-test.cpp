#include "Megolm.hpp"

#include <glog/logging.h>

#include "Base64.hpp"
#include "Crypto.hpp"

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  Megolm::OutboundSession s;
  CHECK_EQ(s.message_index(), 0u);
  CHECK_EQ(s.session_id().size(), 43u);
  CHECK_NE(s.session_id(), Megolm::OutboundSession{}.session_id());

  auto const initial = s.ratchet();
  CHECK_EQ(initial.size(), 128u);

  // Exported key: version, index, ratchet, signing key, signature.
  auto const key = Base64::dec(s.session_key());
  CHECK_EQ(key.size(), 1u + 4 + 128 + 32 + 64);
  CHECK_EQ(key[0], '\x02');
  CHECK_EQ(key.substr(1, 4), std::string(4, '\0'));
  CHECK_EQ(key.substr(5, 128), initial);
  auto const signing_key = key.substr(133, 32);
  CHECK_EQ(Base64::enc(signing_key), s.session_id());
  CHECK(Crypto::Ed25519::verify(signing_key, key.substr(0, 165),
                                key.substr(165)));

  // Decrypt the first message with the exported ratchet.
  auto const plaintext = std::string("hello, room");
  auto const raw       = Base64::dec(s.encrypt(plaintext));
  CHECK_EQ(s.message_index(), 1u);

  CHECK_EQ(raw[0], '\x03');
  CHECK_EQ(raw[1], '\x08'); // message index
  CHECK_EQ(raw[2], '\x00');
  CHECK_EQ(raw[3], '\x12'); // ciphertext
  auto const ct_len = static_cast<unsigned char>(raw[4]);
  CHECK_EQ(ct_len, 16u);
  auto const ciphertext = raw.substr(5, ct_len);
  auto const macd_len   = 5u + ct_len;
  CHECK_EQ(raw.size(), macd_len + 8 + 64);

  CHECK(Crypto::Ed25519::verify(signing_key, raw.substr(0, macd_len + 8),
                                raw.substr(macd_len + 8)));

  auto const keys = Crypto::hkdf_sha256(initial, "", "MEGOLM_KEYS", 80);
  CHECK_EQ(Crypto::hmac_sha256(keys.substr(32, 32), raw.substr(0, macd_len))
               .substr(0, 8),
           raw.substr(macd_len, 8));
  auto const decrypted = Crypto::aes256_cbc_decrypt(
      keys.substr(0, 32), keys.substr(64, 16), ciphertext);
  CHECK(decrypted);
  CHECK_EQ(*decrypted, plaintext);

  // Index 1 only rehashes the last part.
  auto const r1 = s.ratchet();
  CHECK_EQ(r1.substr(0, 96), initial.substr(0, 96));
  CHECK_EQ(r1.substr(96), Crypto::hmac_sha256(initial.substr(96), "\x03"));

  // Index 256 rehashes R(2) and R(3) from R(2).
  std::string r255;
  while (s.message_index() < 256) {
    if (s.message_index() == 255)
      r255 = s.ratchet();
    s.encrypt("x");
  }
  auto const r256 = s.ratchet();
  CHECK_EQ(r256.substr(0, 64), initial.substr(0, 64));
  auto const r2 = Crypto::hmac_sha256(r255.substr(64, 32), std::string(1, '\x02'));
  CHECK_EQ(r256.substr(64, 32), r2);
  CHECK_EQ(r256.substr(96), Crypto::hmac_sha256(r255.substr(64, 32), "\x03"));

  auto const key256 = Base64::dec(s.session_key());
  CHECK_EQ(key256.substr(1, 4), std::string("\x00\x00\x01\x00", 4));
  CHECK_EQ(key256.substr(5, 128), r256);

  // Larger indexes need two varint octets.
  auto const later = Base64::dec(s.encrypt(plaintext));
  CHECK_EQ(later[1], '\x08');
  CHECK_EQ(later[2], '\x80');
  CHECK_EQ(later[3], '\x02');
}
