#include "TLS-OpenSSL.hpp"

#include <stdexcept>
#include <string>

#include <openssl/err.h>
#include <openssl/rand.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>

#include <glog/logging.h>

#include <fmt/format.h>

#include "POSIX.hpp"

namespace {
// ALPN wire form: a length octet, then the protocol name.
unsigned char constexpr alpn_http11[]{8, 'h', 't', 't', 'p', '/', '1', '.', '1'};

int verify_callback(int preverify_ok, X509_STORE_CTX* ctx)
{
  auto const depth = X509_STORE_CTX_get_error_depth(ctx);
  if (depth > Config::cert_verify_depth) {
    X509_STORE_CTX_set_error(ctx, X509_V_ERR_CERT_CHAIN_TOO_LONG);
    preverify_ok = 0;
  }
  if (!preverify_ok) {
    char subject[256]{};
    if (auto const cert = X509_STORE_CTX_get_current_cert(ctx); cert)
      X509_NAME_oneline(X509_get_subject_name(cert), subject, sizeof(subject));
    auto const err = X509_STORE_CTX_get_error(ctx);
    LOG(WARNING) << "certificate at depth " << depth << " «" << subject
                 << "»: " << X509_verify_cert_error_string(err);
  }
  return preverify_ok;
}
} // namespace

TLS::TLS(std::function<void(void)> read_hook)
  : read_hook_(read_hook)
{
}

TLS::~TLS()
{
  SSL_free(ssl_);
  SSL_CTX_free(ctx_);
}

bool TLS::starttls_client(int                       fd_in,
                          int                       fd_out,
                          char const*               server_name,
                          std::chrono::milliseconds timeout)
{
  CHECK(RAND_status());
  CHECK(ctx_ == nullptr) << "one handshake per connection";

  ctx_ = CHECK_NOTNULL(SSL_CTX_new(TLS_client_method()));

  CHECK_EQ(SSL_CTX_set_min_proto_version(ctx_, TLS1_2_VERSION), 1);
  CHECK_EQ(SSL_CTX_set_default_verify_paths(ctx_), 1);
  CHECK_EQ(SSL_CTX_set_alpn_protos(ctx_, alpn_http11, sizeof(alpn_http11)), 0);

  // Servers that close without close_notify once the body is sent are
  // a plain end of stream.
  SSL_CTX_set_options(ctx_, SSL_OP_IGNORE_UNEXPECTED_EOF);

  SSL_CTX_set_verify_depth(ctx_, Config::cert_verify_depth + 1);
  SSL_CTX_set_verify(ctx_, SSL_VERIFY_PEER, verify_callback);

  ssl_ = CHECK_NOTNULL(SSL_new(ctx_));

  CHECK_EQ(SSL_set_rfd(ssl_, fd_in), 1);
  CHECK_EQ(SSL_set_wfd(ssl_, fd_out), 1);

  CHECK_EQ(SSL_set1_host(ssl_, server_name), 1);
  CHECK_EQ(SSL_set_tlsext_host_name(ssl_, server_name), 1);
  SSL_set_hostflags(ssl_, X509_CHECK_FLAG_NO_PARTIAL_WILDCARDS);

  auto const deadline = clock::now() + timeout;

  for (;;) {
    ERR_clear_error();
    auto const rc = SSL_connect(ssl_);
    if (rc == 1)
      break;
    switch (wait_(SSL_get_error(ssl_, rc), deadline)) {
    case io::retry: continue;
    case io::timed_out:
      LOG(WARNING) << "TLS handshake with " << server_name << " timed out";
      return false;
    case io::failed:
      LOG(WARNING) << "TLS handshake with " << server_name << " failed";
      log_errors_();
      return false;
    }
  }

  if (SSL_get_verify_result(ssl_) != X509_V_OK) {
    LOG(WARNING) << server_name << ": certificate failed to verify";
    return false;
  }

  verified_ = true;
  if (auto const peername = SSL_get0_peername(ssl_); peername != nullptr)
    verified_peername_ = peername;

  VLOG(1) << "TLS to " << server_name << ": " << info();
  return true;
}

std::string TLS::info() const
{
  if (!ssl_)
    return "";

  unsigned char const* alpn     = nullptr;
  unsigned             alpn_len = 0;
  SSL_get0_alpn_selected(ssl_, &alpn, &alpn_len);

  auto const cipher = SSL_get_current_cipher(ssl_);
  return fmt::format("version={} cipher={} alpn={}{}{}", SSL_get_version(ssl_),
                     cipher ? SSL_CIPHER_get_name(cipher) : "none",
                     alpn_len ? std::string(reinterpret_cast<char const*>(alpn),
                                            alpn_len)
                              : std::string("none"),
                     verified_ ? " verified " : "", verified_peername_);
}

std::streamsize TLS::read(char*                     s,
                          std::streamsize           n,
                          std::chrono::milliseconds timeout,
                          bool&                     t_o)
{
  auto const deadline = clock::now() + timeout;
  for (;;) {
    ERR_clear_error();
    size_t     got = 0;
    auto const rc  = SSL_read_ex(ssl_, s, static_cast<size_t>(n), &got);
    if (rc == 1)
      return static_cast<std::streamsize>(got);

    auto const err = SSL_get_error(ssl_, rc);
    if (err == SSL_ERROR_ZERO_RETURN)
      return 0;

    switch (wait_(err, deadline)) {
    case io::retry: continue;
    case io::timed_out:
      LOG(WARNING) << "SSL_read timed out";
      t_o = true;
      return static_cast<std::streamsize>(-1);
    case io::failed: ssl_error("SSL_read", err);
    }
  }
}

std::streamsize TLS::write(char const*               s,
                           std::streamsize           n,
                           std::chrono::milliseconds timeout,
                           bool&                     t_o)
{
  auto const deadline = clock::now() + timeout;
  for (;;) {
    ERR_clear_error();
    size_t     put = 0;
    auto const rc  = SSL_write_ex(ssl_, s, static_cast<size_t>(n), &put);
    if (rc == 1)
      return static_cast<std::streamsize>(put);

    auto const err = SSL_get_error(ssl_, rc);
    switch (wait_(err, deadline)) {
    case io::retry: continue;
    case io::timed_out:
      LOG(WARNING) << "SSL_write timed out";
      t_o = true;
      return static_cast<std::streamsize>(-1);
    case io::failed: ssl_error("SSL_write", err);
    }
  }
}

TLS::io TLS::wait_(int err, clock::time_point deadline)
{
  auto const now = clock::now();
  if (now >= deadline)
    return io::timed_out;
  auto const left
      = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);

  switch (err) {
  case SSL_ERROR_WANT_READ:
    read_hook_();
    return POSIX::input_ready(SSL_get_rfd(ssl_), left) ? io::retry
                                                        : io::timed_out;
  case SSL_ERROR_WANT_WRITE:
    return POSIX::output_ready(SSL_get_wfd(ssl_), left) ? io::retry
                                                         : io::timed_out;
  case SSL_ERROR_SYSCALL: PLOG(WARNING) << "TLS transport error"; break;
  }
  return io::failed;
}

void TLS::log_errors_()
{
  for (auto er = ERR_get_error(); er != 0; er = ERR_get_error())
    LOG(WARNING) << ERR_error_string(er, nullptr);
}

void TLS::ssl_error(char const* fn, int err)
{
  auto const what = fmt::format("{}: fatal TLS error {}", fn, err);
  LOG(WARNING) << what;
  log_errors_();
  throw std::runtime_error(what);
}
