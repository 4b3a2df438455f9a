#include "RoomAddress.hpp"

#include <stdexcept>

#include <fmt/format.h>

#include <glog/logging.h>

#include <tao/pegtl.hpp>
#include <tao/pegtl/contrib/abnf.hpp>

using namespace tao::pegtl;
using namespace tao::pegtl::abnf;

namespace Matrix_id {
// clang-format off

// Printable ASCII but the ':' separator, or any non-ASCII code point.
struct localpart : plus<sor<ranges<'!', '9', ';', '~'>,
                            utf8::range<0x80, 0x10FFFF>>> {};

struct dec_octet : rep_min_max<1, 3, DIGIT> {};
struct ipv4_address : seq<dec_octet, one<'.'>, dec_octet, one<'.'>,
                          dec_octet, one<'.'>, dec_octet> {};
struct ipv6_address : seq<one<'['>, plus<sor<HEXDIG, one<':', '.'>>>, one<']'>> {};
struct dns_name : plus<sor<ALPHA, DIGIT, one<'-', '.'>>> {};

struct hostname : sor<ipv6_address, ipv4_address, dns_name> {};
struct port : rep_min_max<1, 5, DIGIT> {};
struct server_name : seq<hostname, opt<one<':'>, port>> {};

struct room_sigil : one<'!'> {};
struct alias_sigil : one<'#'> {};
struct user_sigil : one<'@'> {};

struct sigil : sor<room_sigil, alias_sigil, user_sigil> {};

struct address : seq<sigil, localpart, one<':'>, server_name> {};

struct address_only : seq<address, eof> {};

// clang-format on

template <typename Rule>
struct action : nothing<Rule> {
};

template <>
struct action<room_sigil> {
  template <typename Input>
  static void apply(Input const& in, RoomAddress& a)
  {
    a.set_kind(RoomAddress::form::room_id);
  }
};

template <>
struct action<alias_sigil> {
  template <typename Input>
  static void apply(Input const& in, RoomAddress& a)
  {
    a.set_kind(RoomAddress::form::alias);
  }
};

template <>
struct action<user_sigil> {
  template <typename Input>
  static void apply(Input const& in, RoomAddress& a)
  {
    a.set_kind(RoomAddress::form::user_id);
  }
};

template <>
struct action<localpart> {
  template <typename Input>
  static void apply(Input const& in, RoomAddress& a)
  {
    a.set_localpart(in.string());
  }
};

template <>
struct action<server_name> {
  template <typename Input>
  static void apply(Input const& in, RoomAddress& a)
  {
    a.set_server(in.string());
  }
};
} // namespace Matrix_id

RoomAddress::RoomAddress(std::string_view address)
{
  memory_input<> in{address.data(), address.size(), "address"};
  if (!parse<Matrix_id::address_only, Matrix_id::action>(in, *this)) {
    throw std::invalid_argument(fmt::format("invalid address «{}»", address));
  }
}

bool RoomAddress::validate(std::string_view address)
{
  memory_input<> in{address.data(), address.size(), "address"};
  return parse<Matrix_id::address_only>(in);
}

std::string RoomAddress::as_string() const
{
  auto sigil = '!';
  switch (kind_) {
  case form::room_id: sigil = '!'; break;
  case form::alias: sigil = '#'; break;
  case form::user_id: sigil = '@'; break;
  }
  return fmt::format("{}{}:{}", sigil, localpart_, server_);
}

char const* form_name(RoomAddress::form f)
{
  switch (f) {
  case RoomAddress::form::room_id: return "room ID";
  case RoomAddress::form::alias: return "room alias";
  case RoomAddress::form::user_id: return "user ID";
  }
  LOG(FATAL) << "unknown address form";
  return "";
}
