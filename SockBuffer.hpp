#ifndef SOCKBUFFER_DOT_HPP
#define SOCKBUFFER_DOT_HPP

#include <chrono>
#include <cstddef>
#include <functional>
#include <ios>
#include <memory>
#include <optional>
#include <string>

#include "POSIX.hpp"
#include "TLS-OpenSSL.hpp"

// Enough for every SockBuffer constructor argument.
#define BOOST_IOSTREAMS_MAX_FORWARDING_ARITY 5

#include <boost/iostreams/concepts.hpp>
#include <boost/iostreams/stream.hpp>

namespace Config {
constexpr std::chrono::seconds default_read_timeout{30};
constexpr std::chrono::seconds default_write_timeout{30};
constexpr std::chrono::seconds default_starttls_timeout{30};
} // namespace Config

// Masks a secret in a stream of chunks.  Octets that might begin the
// secret are held back until the next chunk shows whether they do.
class Redactor {
public:
  void set_secret(std::string secret) { secret_ = std::move(secret); }

  // The part of everything passed so far that is safe to show now.
  std::string pass(char const* s, std::size_t n);

  // Whatever is still held back, at end of stream.
  std::string flush();

private:
  std::string secret_;
  std::string held_;
};

// A Boost.Iostreams device over one connected socket, plain or TLS.
// The stream copies its device, so the connection state lives behind a
// shared pointer; every copy is the same connection.
class SockBuffer
  : public boost::iostreams::device<boost::iostreams::bidirectional> {
public:
  SockBuffer(int                       fd,
             std::function<void(void)> read_hook = []() {},
             std::chrono::milliseconds read_timeout
             = Config::default_read_timeout,
             std::chrono::milliseconds write_timeout
             = Config::default_write_timeout,
             std::chrono::milliseconds starttls_timeout
             = Config::default_starttls_timeout);

  bool input_ready(std::chrono::milliseconds wait) const;
  bool timed_out() const { return conn_->timed_out; }

  std::streamsize read(char* s, std::streamsize n);
  std::streamsize write(char const* s, std::streamsize n);

  bool        starttls_client(char const* server_name);
  bool        tls() const { return conn_->tls_active; }
  std::string tls_info() const;

  // No read, write or handshake runs past this point, whatever the
  // per-call timeouts allow.
  void set_deadline(std::chrono::steady_clock::time_point when)
  {
    conn_->deadline = when;
  }

  // Octets matching this are replaced before data logging.
  void set_redact(std::string const& secret)
  {
    conn_->redact_in.set_secret(secret);
    conn_->redact_out.set_secret(secret);
  }

  void log_totals() const;

private:
  struct Conn {
    explicit Conn(std::function<void(void)> hook)
      : read_hook(hook)
      , tls(read_hook)
    {
    }
    ~Conn();

    int fd{-1};

    std::function<void(void)> read_hook;

    std::chrono::milliseconds read_timeout;
    std::chrono::milliseconds write_timeout;
    std::chrono::milliseconds starttls_timeout;

    std::optional<std::chrono::steady_clock::time_point> deadline;

    std::streamsize octets_read{0};
    std::streamsize octets_written{0};

    Redactor redact_in;
    Redactor redact_out;

    bool timed_out{false};
    bool tls_active{false};
    bool log_data{false};

    TLS tls;
  };

  std::chrono::milliseconds budget_(std::chrono::milliseconds limit) const;

  void log_octets_(char const* dir, char const* s, std::streamsize n) const;

  std::shared_ptr<Conn> conn_;
};

#endif // SOCKBUFFER_DOT_HPP
