#include "Base64.hpp"

#include <stdexcept>

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  // RFC 4648 section 10, less the padding.
  CHECK_EQ(Base64::enc(""), "");
  CHECK_EQ(Base64::enc("f"), "Zg");
  CHECK_EQ(Base64::enc("fo"), "Zm8");
  CHECK_EQ(Base64::enc("foo"), "Zm9v");
  CHECK_EQ(Base64::enc("foob"), "Zm9vYg");
  CHECK_EQ(Base64::enc("fooba"), "Zm9vYmE");
  CHECK_EQ(Base64::enc("foobar"), "Zm9vYmFy");

  CHECK_EQ(Base64::dec("Zm9vYg"), "foob");
  CHECK_EQ(Base64::dec("Zm9vYg=="), "foob");
  CHECK_EQ(Base64::dec("Zm9vYmE="), "fooba");

  auto constexpr text{R"(
“We are all in the gutter, but some of us are looking at the stars.”
                                                     ― Oscar Wilde
)"};
  auto s{std::string{text}};
  while (!s.empty()) {
    CHECK_EQ(Base64::dec(Base64::enc(s)), s);
    s.pop_back();
  }

  std::string binary;
  for (auto i = 0; i < 256; ++i)
    binary += static_cast<char>(i);
  CHECK_EQ(Base64::dec(Base64::enc(binary)), binary);

  auto threw = false;
  try {
    Base64::dec("Zm9v!");
  }
  catch (std::invalid_argument const&) {
    threw = true;
  }
  CHECK(threw);

  threw = false;
  try {
    Base64::dec("Zm9vY");
  }
  catch (std::invalid_argument const&) {
    threw = true;
  }
  CHECK(threw);
}
