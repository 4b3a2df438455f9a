#include "Url.hpp"

#include <cctype>
#include <stdexcept>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/predicate.hpp>

#include <fmt/format.h>

#include <glog/logging.h>

#include <tao/pegtl.hpp>
#include <tao/pegtl/contrib/abnf.hpp>

using namespace tao::pegtl;
using namespace tao::pegtl::abnf;

namespace RFC3986 {
// clang-format off

struct unreserved : sor<ALPHA, DIGIT, one<'-', '.', '_', '~'>> {};
struct pct_encoded : seq<one<'%'>, HEXDIG, HEXDIG> {};
struct sub_delims : one<'!', '$', '&', '\'', '(', ')', '*', '+', ',', ';', '='> {};

struct scheme : sor<TAO_PEGTL_ISTRING("https"), TAO_PEGTL_ISTRING("http")> {};

struct ip_literal : seq<one<'['>, plus<sor<HEXDIG, one<':', '.'>>>, one<']'>> {};
struct reg_name : plus<sor<unreserved, pct_encoded>> {};
struct host : sor<ip_literal, reg_name> {};

struct port : rep_min_max<1, 5, DIGIT> {};

struct pchar : sor<unreserved, pct_encoded, sub_delims, one<':', '@'>> {};
struct path_abempty : star<one<'/'>, star<pchar>> {};

struct url : seq<scheme, string<':', '/', '/'>,
                 host, opt<one<':'>, port>,
                 path_abempty> {};

struct url_only : seq<url, eof> {};

// clang-format on

template <typename Rule>
struct action : nothing<Rule> {
};

template <>
struct action<scheme> {
  template <typename Input>
  static void apply(Input const& in, Url& u)
  {
    u.set_scheme(boost::algorithm::to_lower_copy(in.string()));
  }
};

template <>
struct action<host> {
  template <typename Input>
  static void apply(Input const& in, Url& u)
  {
    u.set_host(boost::algorithm::to_lower_copy(in.string()));
  }
};

template <>
struct action<port> {
  template <typename Input>
  static void apply(Input const& in, Url& u)
  {
    auto const p = std::stoul(in.string());
    if (p == 0 || p > 65535)
      throw std::invalid_argument("port out of range");
    u.set_port(static_cast<uint16_t>(p));
  }
};

template <>
struct action<path_abempty> {
  template <typename Input>
  static void apply(Input const& in, Url& u)
  {
    auto path = in.string();
    while (!path.empty() && path.back() == '/')
      path.pop_back();
    u.set_path(path);
  }
};
} // namespace RFC3986

Url::Url(std::string_view url)
{
  memory_input<> in{url.data(), url.size(), "url"};
  if (!parse<RFC3986::url_only, RFC3986::action>(in, *this)) {
    throw std::invalid_argument(fmt::format("invalid URL «{}»", url));
  }
  if (port_ == 0) {
    port_ = tls() ? 443 : 80;
  }
  // Brackets are URL syntax, not part of the address.
  if (host_.size() > 2 && host_.front() == '[') {
    host_ = host_.substr(1, host_.size() - 2);
  }
}

std::string Url::normalize(std::string_view homeserver)
{
  using boost::algorithm::istarts_with;
  if (istarts_with(homeserver, "https://") || istarts_with(homeserver, "http://"))
    return std::string(homeserver);
  return fmt::format("https://{}", homeserver);
}

std::string Url::percent_encode(std::string_view segment)
{
  std::string out;
  out.reserve(segment.size());
  for (auto ch : segment) {
    auto const uch = static_cast<unsigned char>(ch);
    if (std::isalnum(uch) || ch == '-' || ch == '.' || ch == '_' || ch == '~') {
      out += ch;
    }
    else {
      out += fmt::format("%{:02X}", uch);
    }
  }
  return out;
}

std::string Url::authority() const
{
  auto const h = (host_.find(':') != std::string::npos)
                     ? fmt::format("[{}]", host_)
                     : host_;
  if ((tls() && port_ == 443) || (!tls() && port_ == 80))
    return h;
  return fmt::format("{}:{}", h, port_);
}

std::string Url::as_string() const
{
  return fmt::format("{}://{}{}", scheme_, authority(), path_);
}
