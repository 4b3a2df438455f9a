#include "Compose.hpp"

#include <stdexcept>

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  auto const m = compose("hello\n~ignored\nworld\n", "hi");
  CHECK(m.subject);
  CHECK_EQ(*m.subject, "hi");
  CHECK_EQ(m.body, "hello\nworld\n");
  CHECK_EQ(m.text(), "hi\n\nhello\nworld\n");

  // Same inputs, same bytes.
  CHECK_EQ(compose("hello\n~ignored\nworld\n", "hi").text(), m.text());

  auto const plain = compose("hello\n~ignored\nworld\n", std::nullopt);
  CHECK(!plain.subject);
  CHECK_EQ(plain.text(), "hello\nworld\n");

  // No trimming of anything else.
  CHECK_EQ(compose("  spaced  \n\n\n", std::nullopt).text(), "  spaced  \n\n\n");
  CHECK_EQ(compose("", "  subj ").text(), "  subj \n\n");
  CHECK_EQ(compose("body", "").text(), "body");
  CHECK(!compose("body", "").subject);

  CHECK_EQ(strip_escapes(""), "");
  CHECK_EQ(strip_escapes("~"), "");
  CHECK_EQ(strip_escapes("~s new subject\n~.\n"), "");
  CHECK_EQ(strip_escapes("a\n~b"), "a\n");
  CHECK_EQ(strip_escapes("~a\nb"), "b");
  CHECK_EQ(strip_escapes("x~y\n ~z\n"), "x~y\n ~z\n");
  CHECK_EQ(strip_escapes("\n~\n\n"), "\n\n");
  CHECK_EQ(strip_escapes("one\r\n~two\r\nthree"), "one\r\nthree");

  CHECK(is_utf8(""));
  CHECK(is_utf8("caf\xC3\xA9 \xE2\x82\xAC \xF0\x9F\x98\x80"));
  CHECK(!is_utf8("\xC3"));
  CHECK(!is_utf8("\xC0\xAF"));         // overlong
  CHECK(!is_utf8("\xED\xA0\x80"));     // surrogate
  CHECK(!is_utf8("\xF4\x90\x80\x80")); // past U+10FFFF
  CHECK(!is_utf8("\xFF"));

  for (auto bad : {std::pair<char const*, char const*>{"ok", "\xFF"},
                   std::pair<char const*, char const*>{"\xFE", "ok"}}) {
    auto threw = false;
    try {
      compose(bad.first, std::string(bad.second));
    }
    catch (std::invalid_argument const&) {
      threw = true;
    }
    CHECK(threw);
  }
}
