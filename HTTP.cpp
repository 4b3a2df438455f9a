#include "HTTP.hpp"

#include <iterator>
#include <stdexcept>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/predicate.hpp>

#include <glog/logging.h>

#include <tao/pegtl.hpp>
#include <tao/pegtl/contrib/abnf.hpp>

#include "POSIX.hpp"
#include "Sock.hpp"

using namespace tao::pegtl;
using namespace tao::pegtl::abnf;

namespace RFC7230 {
// clang-format off

struct tchar : sor<ALPHA, DIGIT,
                   one<'!', '#', '$', '%', '&', '\'', '*',
                       '+', '-', '.', '^', '_', '`', '|', '~'>> {};
struct token : plus<tchar> {};

struct obs_text : range<'\x80', '\xFF'> {};

struct OWS : star<sor<SP, HTAB>> {};

struct HTTP_version : seq<string<'H', 'T', 'T', 'P', '/'>, DIGIT, one<'.'>, DIGIT> {};
struct status_code : rep<3, DIGIT> {};
struct reason_phrase : star<sor<HTAB, SP, VCHAR, obs_text>> {};

struct status_line : seq<HTTP_version, SP, status_code,
                         opt<SP, reason_phrase>, eof> {};

struct field_name : token {};
struct field_value : star<sor<VCHAR, obs_text, SP, HTAB>> {};
struct header_field : seq<field_name, one<':'>, OWS, field_value, eof> {};

struct chunk_ext : star<one<';'>, star<not_one<';'>>> {};
struct chunk_size : plus<HEXDIG> {};
struct chunk_line : seq<chunk_size, OWS, chunk_ext, eof> {};

// clang-format on

template <typename Rule>
struct action : nothing<Rule> {
};

template <>
struct action<status_code> {
  template <typename Input>
  static void apply(Input const& in, HTTP::Response& rsp)
  {
    rsp.status = std::stoi(in.string());
  }
};

template <>
struct action<reason_phrase> {
  template <typename Input>
  static void apply(Input const& in, HTTP::Response& rsp)
  {
    rsp.reason = in.string();
  }
};

template <typename Rule>
struct field_action : nothing<Rule> {
};

template <>
struct field_action<field_name> {
  template <typename Input>
  static void apply(Input const& in, std::pair<std::string, std::string>& f)
  {
    f.first = boost::algorithm::to_lower_copy(in.string());
  }
};

template <>
struct field_action<field_value> {
  template <typename Input>
  static void apply(Input const& in, std::pair<std::string, std::string>& f)
  {
    f.second = in.string();
    while (!f.second.empty()
           && (f.second.back() == ' ' || f.second.back() == '\t'))
      f.second.pop_back();
  }
};

template <typename Rule>
struct chunk_action : nothing<Rule> {
};

template <>
struct chunk_action<chunk_size> {
  template <typename Input>
  static void apply(Input const& in, unsigned long long& size)
  {
    if (in.size() > 8)
      throw std::invalid_argument("chunk too large");
    size = std::stoull(in.string(), nullptr, 16);
  }
};
} // namespace RFC7230

namespace {
bool get_line(std::istream& is, std::string& line)
{
  if (!std::getline(is, line))
    return false;
  if (!line.empty() && line.back() == '\r')
    line.pop_back();
  return true;
}

bool read_exactly(std::istream& is, std::string& body, std::streamsize n)
{
  auto const old = body.size();
  body.resize(old + static_cast<size_t>(n));
  is.read(&body[old], n);
  return is.gcount() == n;
}

bool read_chunked(std::istream& is, std::string& body)
{
  for (std::string line;;) {
    if (!get_line(is, line)) {
      LOG(WARNING) << "EOF reading chunk size";
      return false;
    }
    unsigned long long size = 0;
    memory_input<>     in{line.data(), line.size(), "chunk"};
    try {
      if (!parse<RFC7230::chunk_line, RFC7230::chunk_action>(in, size)) {
        LOG(WARNING) << "bad chunk size line «" << line << "»";
        return false;
      }
    }
    catch (std::invalid_argument const& e) {
      LOG(WARNING) << e.what();
      return false;
    }
    if (size == 0)
      break;
    if (body.size() + size > Config::max_body_size) {
      LOG(WARNING) << "response body too large";
      return false;
    }
    if (!read_exactly(is, body, static_cast<std::streamsize>(size))
        || !get_line(is, line) || !line.empty()) {
      LOG(WARNING) << "short chunk";
      return false;
    }
  }

  // Trailer section, which we ignore.
  for (std::string line; get_line(is, line) && !line.empty();) {
  }
  return true;
}
} // namespace

namespace HTTP {

std::optional<std::string> Response::header(std::string const& name) const
{
  auto const it = headers.find(boost::algorithm::to_lower_copy(name));
  if (it == headers.end())
    return {};
  return it->second;
}

void write_request(std::ostream& os, Request const& req)
{
  os << req.method << ' ' << req.target << " HTTP/1.1\r\n";
  for (auto const& [name, value] : req.headers) {
    os << name << ": " << value << "\r\n";
  }
  os << "\r\n" << req.body;
}

std::optional<Response> read_response(std::istream& is)
{
  Response rsp;

  std::string line;
  if (!get_line(is, line)) {
    LOG(WARNING) << "no response";
    return {};
  }
  memory_input<> status_in{line.data(), line.size(), "status-line"};
  if (!parse<RFC7230::status_line, RFC7230::action>(status_in, rsp)) {
    LOG(WARNING) << "bad status line «" << line << "»";
    return {};
  }

  for (auto n = 0;; ++n) {
    if (n == Config::max_header_lines) {
      LOG(WARNING) << "too many header fields";
      return {};
    }
    if (!get_line(is, line)) {
      LOG(WARNING) << "EOF in header section";
      return {};
    }
    if (line.empty())
      break;

    std::pair<std::string, std::string> field;
    memory_input<> field_in{line.data(), line.size(), "header-field"};
    if (!parse<RFC7230::header_field, RFC7230::field_action>(field_in, field)) {
      LOG(WARNING) << "bad header field «" << line << "»";
      return {};
    }
    auto [it, inserted] = rsp.headers.emplace(field);
    if (!inserted) {
      it->second += ", " + field.second;
    }
  }

  // 1xx, 204 and 304 carry no body.
  if ((rsp.status / 100) == 1 || rsp.status == 204 || rsp.status == 304)
    return rsp;

  if (auto const te = rsp.header("transfer-encoding");
      te && boost::algorithm::icontains(*te, "chunked")) {
    if (!read_chunked(is, rsp.body))
      return {};
    return rsp;
  }

  if (auto const cl = rsp.header("content-length"); cl) {
    unsigned long long len = 0;
    try {
      size_t idx = 0;
      len        = std::stoull(*cl, &idx);
      if (idx != cl->size())
        throw std::invalid_argument("trailing junk");
    }
    catch (std::logic_error const&) {
      LOG(WARNING) << "bad content-length «" << *cl << "»";
      return {};
    }
    if (len > Config::max_body_size) {
      LOG(WARNING) << "response body too large";
      return {};
    }
    if (!read_exactly(is, rsp.body, static_cast<std::streamsize>(len))) {
      LOG(WARNING) << "short body";
      return {};
    }
    return rsp;
  }

  // Delimited by connection close.
  rsp.body.assign(std::istreambuf_iterator<char>(is),
                  std::istreambuf_iterator<char>());
  return rsp;
}

Client::Client(Url base, std::chrono::milliseconds timeout)
  : base_(std::move(base))
  , timeout_(timeout)
{
}

std::optional<Response> Client::exchange(Request const&     req,
                                         std::string const& redact) const
{
  // The timeout bounds the whole exchange, not each read or write.
  auto const deadline = std::chrono::steady_clock::now() + timeout_;

  auto const fd = POSIX::connect(base_.host(), base_.port(), timeout_);
  if (fd == -1) {
    LOG(WARNING) << "no connection to " << base_.authority();
    return {};
  }

  Sock sock(fd, []() {}, timeout_, timeout_, timeout_);
  sock.set_deadline(deadline);
  if (!redact.empty())
    sock.set_redact(redact);

  if (base_.tls()) {
    if (!sock.starttls_client(base_.host().c_str())) {
      LOG(WARNING) << "TLS with " << base_.authority() << " failed";
      return {};
    }
    VLOG(1) << sock.tls_info();
  }

  auto full = req;
  full.target = base_.path() + req.target;
  full.headers.emplace_back("Host", base_.authority());
  full.headers.emplace_back("User-Agent", "mxmail");
  full.headers.emplace_back("Connection", "close");
  if (!req.body.empty() || req.method == "POST" || req.method == "PUT") {
    full.headers.emplace_back("Content-Length", std::to_string(req.body.size()));
  }

  write_request(sock.out(), full);
  sock.out().flush();
  if (!sock.out()) {
    LOG(WARNING) << req.method << " " << req.target << " to "
                 << base_.authority()
                 << (sock.timed_out() ? " timed out" : " write failed");
    return {};
  }

  auto rsp = read_response(sock.in());
  if (!rsp && sock.timed_out()) {
    LOG(WARNING) << req.method << " " << req.target << " to "
                 << base_.authority() << " timed out";
  }
  return rsp;
}

} // namespace HTTP
