#include "Pill.hpp"

#include <algorithm>
#include <stdexcept>

#include <openssl/rand.h>

#include <glog/logging.h>

Pill::Pill()
{
  CHECK_EQ(RAND_bytes(bytes_.data(), bytes_.size()), 1) << "RAND_bytes failed";
  encode_();
}

Pill::Pill(std::string_view bytes)
{
  if (bytes.size() != bytes_.size())
    throw std::invalid_argument("wrong size for a pill");
  std::copy(bytes.begin(), bytes.end(), bytes_.begin());
  encode_();
}

// <http://philzimmermann.com/docs/human-oriented-base-32-encoding.txt>
void Pill::encode_()
{
  constexpr char b32_charset[]{"ybndrfg8ejkmcpqxot1uwisza345h769"};

  text_.clear();
  text_.reserve(digits);

  unsigned acc  = 0;
  auto     bits = 0;
  for (auto b : bytes_) {
    acc = (acc << 8) | b;
    bits += 8;
    while (bits >= 5) {
      bits -= 5;
      text_ += b32_charset[(acc >> bits) & 0x1f];
    }
  }
  if (bits > 0)
    text_ += b32_charset[(acc << (5 - bits)) & 0x1f];
}
