#ifndef TLS_OPENSSL_DOT_HPP
#define TLS_OPENSSL_DOT_HPP

#include <chrono>
#include <functional>
#include <ios>
#include <string>

#include <openssl/ssl.h>

namespace Config {
auto constexpr cert_verify_depth{10};
} // namespace Config

// The client end of a TLS connection over a pair of non-blocking
// descriptors.  Reads and writes give up after their timeout; a fatal
// TLS error throws std::runtime_error.
class TLS {
public:
  TLS(TLS const&) = delete;
  TLS& operator=(const TLS&) = delete;

  explicit TLS(std::function<void(void)> read_hook);
  ~TLS();

  // Handshake, offering HTTP/1.1 by ALPN and verifying the peer against
  // the system trust store and server_name.  False if the handshake
  // failed, timed out or the peer did not verify.
  bool starttls_client(int                       fd_in,
                       int                       fd_out,
                       char const*               server_name,
                       std::chrono::milliseconds timeout);

  bool pending() const { return ssl_ && SSL_pending(ssl_) > 0; }

  // Zero at end of stream, -1 on timeout (and t_o is set).
  std::streamsize
  read(char* s, std::streamsize n, std::chrono::milliseconds timeout, bool& t_o);
  std::streamsize write(char const*               s,
                        std::streamsize           n,
                        std::chrono::milliseconds timeout,
                        bool&                     t_o);

  // Protocol version, cipher, ALPN and the verified peer name.
  std::string info() const;

private:
  using clock = std::chrono::steady_clock;

  enum class io { retry, timed_out, failed };

  // What to do after an SSL call came back with err.
  io wait_(int err, clock::time_point deadline);

  [[noreturn]] static void ssl_error(char const* fn, int err);
  static void              log_errors_();

  SSL_CTX* ctx_{nullptr};
  SSL*     ssl_{nullptr};

  std::function<void(void)> read_hook_;

  std::string verified_peername_;
  bool        verified_{false};
};

#endif // TLS_OPENSSL_DOT_HPP
