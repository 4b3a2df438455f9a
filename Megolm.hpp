#ifndef MEGOLM_DOT_HPP
#define MEGOLM_DOT_HPP

#include <array>
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

#include "Crypto.hpp"

namespace Megolm {

auto constexpr algorithm = "m.megolm.v1.aes-sha2";

auto constexpr ratchet_parts     = 4;
auto constexpr ratchet_part_size = 32;

// The sending half of a room's group session.  Each encrypt() uses the
// ratchet at the current index and then advances it; nothing can wind
// it back.
class OutboundSession {
public:
  OutboundSession();

  // Base64 of the Ed25519 signing key.
  std::string session_id() const;

  uint32_t message_index() const { return counter_; }

  // The exportable room key (version 2) at the current index.
  std::string session_key() const;

  // Base64 ciphertext of plaintext at the current index.
  std::string encrypt(std::string_view plaintext);

  std::chrono::steady_clock::time_point created() const { return created_; }

  // The concatenated ratchet parts.
  std::string ratchet() const;

private:
  void advance_();

  std::array<std::string, ratchet_parts> R_;
  uint32_t                               counter_{0};

  Crypto::Ed25519 signing_key_;

  std::chrono::steady_clock::time_point created_;
};

} // namespace Megolm

#endif // MEGOLM_DOT_HPP
