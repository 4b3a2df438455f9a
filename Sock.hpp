#ifndef SOCK_DOT_HPP
#define SOCK_DOT_HPP

#include <chrono>
#include <functional>
#include <string>

#include "SockBuffer.hpp"

// A connected stream socket, optionally wrapped in TLS, presented as an
// iostream.  The descriptor is closed on destruction.
class Sock {
public:
  Sock(const Sock&) = delete;
  Sock& operator=(const Sock&) = delete;

  Sock(int                       fd,
       std::function<void(void)> read_hook     = []() {},
       std::chrono::milliseconds read_timeout  = Config::default_read_timeout,
       std::chrono::milliseconds write_timeout = Config::default_write_timeout,
       std::chrono::milliseconds starttls_timeout
       = Config::default_starttls_timeout);
  ~Sock();

  bool input_ready(std::chrono::milliseconds wait)
  {
    return iostream_->input_ready(wait);
  }
  bool timed_out() { return iostream_->timed_out(); }

  std::istream& in() { return iostream_; }
  std::ostream& out() { return iostream_; }

  bool starttls_client(char const* server_name)
  {
    return iostream_->starttls_client(server_name);
  }
  bool        tls() { return iostream_->tls(); }
  std::string tls_info() { return iostream_->tls_info(); }

  void set_deadline(std::chrono::steady_clock::time_point when)
  {
    iostream_->set_deadline(when);
  }

  void set_redact(std::string const& secret)
  {
    iostream_->set_redact(secret);
  }

  void log_totals() { return iostream_->log_totals(); }

private:
  int fd_;

  boost::iostreams::stream<SockBuffer> iostream_;
};

#endif // SOCK_DOT_HPP
