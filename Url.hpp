#ifndef URL_DOT_HPP
#define URL_DOT_HPP

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>

// The homeserver base URL: http or https, a host, an optional port and
// an optional path prefix.  Query strings and fragments are not
// accepted.

class Url {
public:
  Url() = default;

  // Throws std::invalid_argument if url does not parse.
  explicit Url(std::string_view url);

  // A bare "matrix.org" becomes "https://matrix.org".
  static std::string normalize(std::string_view homeserver);

  // Escape everything outside RFC 3986 unreserved, for use as a single
  // path segment.
  static std::string percent_encode(std::string_view segment);

  std::string const& scheme() const { return scheme_; }
  std::string const& host() const { return host_; }
  uint16_t           port() const { return port_; }
  std::string const& path() const { return path_; }

  bool tls() const { return scheme_ == "https"; }

  // Value for the Host: header, port included only when not the default.
  std::string authority() const;

  std::string as_string() const;

  void set_scheme(std::string_view s) { scheme_ = s; }
  void set_host(std::string_view h) { host_ = h; }
  void set_port(uint16_t p) { port_ = p; }
  void set_path(std::string_view p) { path_ = p; }

private:
  std::string scheme_;
  std::string host_;
  uint16_t    port_{0};
  std::string path_;
};

inline std::ostream& operator<<(std::ostream& s, Url const& url)
{
  return s << url.as_string();
}

#endif // URL_DOT_HPP
