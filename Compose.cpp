#include "Compose.hpp"

#include <stdexcept>

#include <fmt/format.h>

#include <tao/pegtl.hpp>

using namespace tao::pegtl;

namespace RFC3629 {
// clang-format off

struct tail : range<'\x80', '\xBF'> {};

struct ch_1 : range<'\x00', '\x7F'> {};

struct ch_2 : seq<range<'\xC2', '\xDF'>, tail> {};

struct ch_3 : sor<seq<one<'\xE0'>, range<'\xA0', '\xBF'>, tail>,
                  seq<range<'\xE1', '\xEC'>, rep<2, tail>>,
                  seq<one<'\xED'>, range<'\x80', '\x9F'>, tail>,
                  seq<range<'\xEE', '\xEF'>, rep<2, tail>>> {};

struct ch_4 : sor<seq<one<'\xF0'>, range<'\x90', '\xBF'>, rep<2, tail>>,
                  seq<range<'\xF1', '\xF3'>, rep<3, tail>>,
                  seq<one<'\xF4'>, range<'\x80', '\x8F'>, rep<2, tail>>> {};

struct u8char : sor<ch_1, ch_2, ch_3, ch_4> {};

struct utf8_only : seq<star<u8char>, eof> {};

// clang-format on
} // namespace RFC3629

bool is_utf8(std::string_view s)
{
  memory_input<> in{s.data(), s.size(), "utf8"};
  return parse<RFC3629::utf8_only>(in);
}

std::string strip_escapes(std::string_view raw)
{
  std::string out;
  out.reserve(raw.size());
  while (!raw.empty()) {
    auto const eol  = raw.find('\n');
    auto const len  = (eol == std::string_view::npos) ? raw.size() : eol + 1;
    auto const line = raw.substr(0, len);
    if (line.front() != '~')
      out.append(line);
    raw.remove_prefix(len);
  }
  return out;
}

Message compose(std::string_view raw, std::optional<std::string> subject)
{
  if (!is_utf8(raw))
    throw std::invalid_argument("message body is not valid UTF-8");
  if (subject && !is_utf8(*subject))
    throw std::invalid_argument("subject is not valid UTF-8");

  Message msg;
  if (subject && !subject->empty())
    msg.subject = std::move(subject);
  msg.body = strip_escapes(raw);
  return msg;
}

std::string Message::text() const
{
  if (subject)
    return fmt::format("{}\n\n{}", *subject, body);
  return body;
}
