#ifndef HTTP_DOT_HPP
#define HTTP_DOT_HPP

#include <chrono>
#include <cstddef>
#include <istream>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "Url.hpp"

namespace Config {
constexpr auto max_header_lines = 100;
constexpr std::size_t max_body_size = 16 * 1024 * 1024;
} // namespace Config

namespace HTTP {

struct Request {
  std::string method;
  std::string target; // origin-form, starts with '/'

  std::vector<std::pair<std::string, std::string>> headers;

  std::string body;
};

struct Response {
  int         status{0};
  std::string reason;

  std::map<std::string, std::string> headers; // names in lower case

  std::string body;

  std::optional<std::string> header(std::string const& name) const;
};

void write_request(std::ostream& os, Request const& req);

// HTTP/1.1 response with a content-length, chunked, or close delimited
// body.  nullopt if the stream ends early or the head won't parse.
std::optional<Response> read_response(std::istream& is);

// Speaks HTTP/1.1 to one origin, opening a new connection (with TLS
// for https) for every exchange.
class Client {
public:
  Client(Url base, std::chrono::milliseconds timeout);

  Url const& base() const { return base_; }

  // nullopt on any connection, TLS or protocol failure.  The redact
  // string is masked in data logs.
  std::optional<Response> exchange(Request const&     req,
                                   std::string const& redact = "") const;

private:
  Url                       base_;
  std::chrono::milliseconds timeout_;
};

} // namespace HTTP

#endif // HTTP_DOT_HPP
