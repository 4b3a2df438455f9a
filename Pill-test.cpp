#include "Pill.hpp"

#include <set>
#include <sstream>
#include <stdexcept>

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  CHECK_EQ(Pill::digits, 26);

  Pill const zero{std::string(16, '\0')};
  CHECK_EQ(zero.as_string(), std::string(26, 'y'));

  Pill const ones{std::string(16, '\xff')};
  CHECK_EQ(ones.as_string(), std::string(25, '9') + "h");

  // 0x08 is 00001 000..., the second digit carries the low bits.
  Pill const eight{std::string("\x08") + std::string(15, '\0')};
  CHECK_EQ(eight.as_string(), "b" + std::string(25, 'y'));

  auto threw = false;
  try {
    Pill short_one{"abc"};
  }
  catch (std::invalid_argument const&) {
    threw = true;
  }
  CHECK(threw);

  Pill red, blue;
  CHECK(red != blue);
  CHECK_EQ(red.as_string().length(), 26u);

  std::ostringstream os;
  os << red;
  CHECK_EQ(os.str(), red.as_string());

  Pill const red2(red);
  CHECK(red == red2);

  std::set<std::string> seen;
  for (auto i = 0; i < 1000; ++i)
    CHECK(seen.insert(Pill{}.as_string()).second);
}
