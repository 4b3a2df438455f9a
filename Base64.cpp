#include "Base64.hpp"

#include <algorithm>
#include <stdexcept>

#include <glog/logging.h>

namespace Base64 {

constexpr char const CHARSET[]{
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/"};

namespace {
int CHARSET_find(char ch)
{
  auto const end = std::begin(CHARSET) + 64;
  auto const it  = std::find(std::begin(CHARSET), end, ch);
  if (it == end)
    throw std::invalid_argument("bad character in decode");
  return static_cast<int>(it - std::begin(CHARSET));
}
} // namespace

std::string enc(std::string_view text)
{
  auto const full_groups = text.length() / 3;
  auto const remainder   = text.length() % 3;
  auto const total_size
      = full_groups * 4 + (remainder ? remainder + 1 : 0);

  std::string enc_text;
  enc_text.reserve(total_size);

  unsigned long bits  = 0;
  int           nbits = 0;
  for (auto ch : text) {
    bits = (bits << 8) | static_cast<unsigned char>(ch);
    nbits += 8;
    while (nbits >= 6) {
      nbits -= 6;
      enc_text += CHARSET[(bits >> nbits) & 0x3f];
    }
  }
  if (nbits > 0) {
    enc_text += CHARSET[(bits << (6 - nbits)) & 0x3f];
  }

  CHECK_EQ(enc_text.length(), total_size);

  return enc_text;
}

std::string dec(std::string_view text)
{
  while (!text.empty() && text.back() == '=')
    text.remove_suffix(1);

  if (text.length() % 4 == 1)
    throw std::invalid_argument("truncated base64 input");

  std::string dec_text;
  dec_text.reserve((text.length() * 3) / 4);

  unsigned long bits  = 0;
  int           nbits = 0;
  for (auto ch : text) {
    bits = (bits << 6) | static_cast<unsigned long>(CHARSET_find(ch));
    nbits += 6;
    if (nbits >= 8) {
      nbits -= 8;
      dec_text += static_cast<char>((bits >> nbits) & 0xff);
    }
  }

  return dec_text;
}
} // namespace Base64
