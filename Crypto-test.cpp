#include "Crypto.hpp"

#include <stdexcept>

#include <fmt/format.h>

#include <glog/logging.h>

namespace {
std::string hex(std::string_view bin)
{
  std::string out;
  for (auto ch : bin)
    out += fmt::format("{:02x}", static_cast<unsigned char>(ch));
  return out;
}

std::string unhex(std::string_view hx)
{
  CHECK_EQ(hx.size() % 2, 0u);
  std::string out;
  for (size_t i = 0; i < hx.size(); i += 2)
    out += static_cast<char>(std::stoi(std::string(hx.substr(i, 2)), nullptr, 16));
  return out;
}
} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  CHECK_EQ(Crypto::random_bytes(32).size(), 32u);
  CHECK_NE(Crypto::random_bytes(16), Crypto::random_bytes(16));

  CHECK_EQ(hex(Crypto::sha256("abc")),
           "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

  // RFC 4231 test case 2
  CHECK_EQ(hex(Crypto::hmac_sha256("Jefe", "what do ya want for nothing?")),
           "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");

  // RFC 5869 test case 1
  auto const okm = Crypto::hkdf_sha256(
      std::string(22, '\x0b'), unhex("000102030405060708090a0b0c"),
      unhex("f0f1f2f3f4f5f6f7f8f9"), 42);
  CHECK_EQ(hex(okm), "3cb25f25faacd57a90434f64d0362f2a2d2d0a90cf1a5a4c5db02d56"
                     "ecc4c5bf34007208d5b887185865");

  // RFC 5869 test case 3: zero length salt and info.
  auto const okm3 = Crypto::hkdf_sha256(std::string(22, '\x0b'), "", "", 42);
  CHECK_EQ(hex(okm3), "8da4e775a563c18f715f802a063c5a31b8a11f5c5ee1879ec3454e5f"
                      "3c738d2d9d201395faa4b61a96c8");

  // NIST SP 800-38A F.2.5, first block.
  auto const key
      = unhex("603deb1015ca71be2b73aef0857d77811f352c073b6108d72d9810a30914dff4");
  auto const iv = unhex("000102030405060708090a0b0c0d0e0f");
  auto const pt = unhex("6bc1bee22e409f96e93d7e117393172a");
  auto const ct = Crypto::aes256_cbc_encrypt(key, iv, pt);
  CHECK_EQ(ct.size(), 32u); // one block of padding
  CHECK_EQ(hex(ct.substr(0, 16)), "f58c4c04d6e5f1ba779eabfb5f7bfbd6");
  CHECK_EQ(*Crypto::aes256_cbc_decrypt(key, iv, ct), pt);

  auto const msg = std::string("hello, world");
  auto const enc = Crypto::aes256_cbc_encrypt(key, iv, msg);
  CHECK_EQ(enc.size(), 16u);
  CHECK_EQ(*Crypto::aes256_cbc_decrypt(key, iv, enc), msg);
  CHECK(!Crypto::aes256_cbc_decrypt(key, iv, enc.substr(0, 15)));

  // RFC 7748 section 6.1
  Crypto::Curve25519 alice{unhex(
      "77076d0a7318a57d3c16c17251b26645df4c2f87ebc0992ab177fba51db92c2a")};
  Crypto::Curve25519 bob{unhex(
      "5dab087e624a8a4b79e17f8b83800ee66f3bb1292618b6fd1c2f8b27ff88e0eb")};
  CHECK_EQ(hex(alice.public_key()),
           "8520f0098930a754748b7ddcb43ef75a0dbf3a0d26381af4eba4a98eaa9b4e6a");
  CHECK_EQ(hex(bob.public_key()),
           "de9edb7d7b7dc1b4d35b61c2ece435373f8343c85b78674dadfc7e146f882b4f");
  CHECK_EQ(hex(alice.agree(bob.public_key())),
           "4a5d9d5ba4ce2de1728e3bf480350f25e07e21c947d19e3376f09b3c1e161742");
  CHECK_EQ(alice.agree(bob.public_key()), bob.agree(alice.public_key()));

  Crypto::Curve25519 carol, dave;
  CHECK_EQ(carol.agree(dave.public_key()), dave.agree(carol.public_key()));
  CHECK_EQ(Crypto::Curve25519(carol.private_key()).public_key(),
           carol.public_key());

  auto threw = false;
  try {
    carol.agree("short");
  }
  catch (std::invalid_argument const&) {
    threw = true;
  }
  CHECK(threw);

  // RFC 8032 section 7.1, test 1
  Crypto::Ed25519 signer{unhex(
      "9d61b19deffd5a60ba844af492ec2cc44449c5697b326919703bac031cae7f60")};
  CHECK_EQ(hex(signer.public_key()),
           "d75a980182b10ab7d54bfed3c964073a0ee172f3daa62325af021a68f707511a");
  auto const sig = signer.sign("");
  CHECK_EQ(hex(sig),
           "e5564300c360ac729086e2cc806e828a84877f1eb8e5d974d873e06522490155"
           "5fb8821590a33bacc61e39701cf9b46bd25bf5f0595bbe24655141438e7a100b");
  CHECK(Crypto::Ed25519::verify(signer.public_key(), "", sig));
  CHECK(!Crypto::Ed25519::verify(signer.public_key(), "x", sig));
  CHECK(!Crypto::Ed25519::verify(signer.public_key(), "", sig.substr(1)));
  CHECK(!Crypto::Ed25519::verify("bogus", "", sig));

  Crypto::Ed25519 fresh;
  auto const fresh_sig = fresh.sign(msg);
  CHECK(Crypto::Ed25519::verify(fresh.public_key(), msg, fresh_sig));
  CHECK_EQ(Crypto::Ed25519(fresh.seed()).public_key(), fresh.public_key());
}
