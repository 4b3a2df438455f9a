#include "Megolm.hpp"

#include <glog/logging.h>

#include "Base64.hpp"
#include "wire.hpp"

namespace {
auto constexpr protocol_version    = '\x03';
auto constexpr session_key_version = '\x02';
auto constexpr mac_length          = 8;

auto constexpr keys_info = "MEGOLM_KEYS";
} // namespace

namespace Megolm {

OutboundSession::OutboundSession()
  : created_(std::chrono::steady_clock::now())
{
  for (auto& part : R_) {
    part = Crypto::random_bytes(ratchet_part_size);
  }
}

std::string OutboundSession::session_id() const
{
  return Base64::enc(signing_key_.public_key());
}

std::string OutboundSession::ratchet() const
{
  std::string r;
  for (auto const& part : R_)
    r += part;
  return r;
}

std::string OutboundSession::session_key() const
{
  std::string key(1, session_key_version);
  for (auto shift : {24, 16, 8, 0})
    key += static_cast<char>((counter_ >> shift) & 0xff);
  key += ratchet();
  key += signing_key_.public_key();
  key += signing_key_.sign(key);
  return Base64::enc(key);
}

std::string OutboundSession::encrypt(std::string_view plaintext)
{
  auto const keys    = Crypto::hkdf_sha256(ratchet(), "", keys_info, 80);
  auto const aes_key = keys.substr(0, 32);
  auto const mac_key = keys.substr(32, 32);
  auto const iv      = keys.substr(64, 16);

  auto const ciphertext = Crypto::aes256_cbc_encrypt(aes_key, iv, plaintext);

  std::string msg(1, protocol_version);
  wire::put_uint(msg, 0x08, counter_);
  wire::put_bytes(msg, 0x12, ciphertext);
  msg += Crypto::hmac_sha256(mac_key, msg).substr(0, mac_length);
  msg += signing_key_.sign(msg);

  advance_();

  return Base64::enc(msg);
}

// R(i) for i >= h is rehashed from R(h), where h is the most significant
// byte of the counter that changed.
void OutboundSession::advance_()
{
  ++counter_;

  uint32_t mask = 0x00FFFFFF;
  int      h    = 0;
  while (h < ratchet_parts && (counter_ & mask)) {
    ++h;
    mask >>= 8;
  }

  for (int i = ratchet_parts - 1; i >= h; --i) {
    R_[i] = Crypto::hmac_sha256(R_[h], std::string(1, static_cast<char>(i)));
  }
}

} // namespace Megolm
