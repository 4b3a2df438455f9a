#include "SockBuffer.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string_view>

#include <fmt/format.h>

#include <gflags/gflags.h>

#include <glog/logging.h>

DEFINE_bool(log_data, false, "log every octet sent and received");

SockBuffer::SockBuffer(int                       fd,
                       std::function<void(void)> read_hook,
                       std::chrono::milliseconds read_timeout,
                       std::chrono::milliseconds write_timeout,
                       std::chrono::milliseconds starttls_timeout)
  : conn_(std::make_shared<Conn>(read_hook))
{
  conn_->fd               = fd;
  conn_->read_timeout     = read_timeout;
  conn_->write_timeout    = write_timeout;
  conn_->starttls_timeout = starttls_timeout;
  conn_->log_data = FLAGS_log_data || (getenv("MXMAIL_LOG_DATA") != nullptr);

  POSIX::set_nonblocking(fd);
}

bool SockBuffer::input_ready(std::chrono::milliseconds wait) const
{
  return (conn_->tls_active && conn_->tls.pending())
         || POSIX::input_ready(conn_->fd, wait);
}

std::streamsize SockBuffer::read(char* s, std::streamsize n)
{
  auto& c    = *conn_;
  auto  read = c.tls_active
                   ? c.tls.read(s, n, budget_(c.read_timeout), c.timed_out)
                   : POSIX::read(c.fd, s, n, c.read_hook,
                                 budget_(c.read_timeout), c.timed_out);
  if (read == 0)
    return static_cast<std::streamsize>(-1); // EOF for Boost

  if (read > 0) {
    c.octets_read += read;
    if (c.log_data)
      log_octets_("<", s, read);
  }
  return read;
}

std::streamsize SockBuffer::write(char const* s, std::streamsize n)
{
  auto&      c       = *conn_;
  auto const written = c.tls_active
                           ? c.tls.write(s, n, budget_(c.write_timeout),
                                         c.timed_out)
                           : POSIX::write(c.fd, s, n, budget_(c.write_timeout),
                                          c.timed_out);
  if (written > 0) {
    c.octets_written += written;
    if (c.log_data)
      log_octets_(">", s, written);
  }
  return written;
}

bool SockBuffer::starttls_client(char const* server_name)
{
  auto& c      = *conn_;
  c.tls_active = c.tls.starttls_client(c.fd, c.fd, server_name,
                                       budget_(c.starttls_timeout));
  return c.tls_active;
}

std::chrono::milliseconds
SockBuffer::budget_(std::chrono::milliseconds limit) const
{
  if (!conn_->deadline)
    return limit;
  auto const left = std::chrono::duration_cast<std::chrono::milliseconds>(
      *conn_->deadline - std::chrono::steady_clock::now());
  return std::clamp(left, std::chrono::milliseconds{0}, limit);
}

std::string SockBuffer::tls_info() const
{
  return tls() ? conn_->tls.info() : "";
}

namespace {
// Control characters shown as escapes.
std::string escaped(std::string const& str)
{
  std::string shown;
  shown.reserve(str.size());
  for (auto ch : str) {
    auto const uch = static_cast<unsigned char>(ch);
    switch (ch) {
    case '\r': shown += "\\r"; break;
    case '\n': shown += "\\n"; break;
    case '\t': shown += "\\t"; break;
    default:
      if (uch < 0x20 || uch == 0x7f)
        shown += fmt::format("\\x{:02x}", uch);
      else
        shown += ch;
    }
  }
  return shown;
}
} // namespace

std::string Redactor::pass(char const* s, std::size_t n)
{
  held_.append(s, n);
  if (secret_.empty())
    return flush();

  std::string_view const mark{"<redacted>"};
  for (auto pos = held_.find(secret_); pos != std::string::npos;
       pos      = held_.find(secret_, pos + mark.size())) {
    held_.replace(pos, secret_.size(), mark);
  }

  // Longest tail the secret starts with.
  auto keep = std::min(held_.size(), secret_.size() - 1);
  for (; keep > 0; --keep) {
    if (held_.compare(held_.size() - keep, keep, secret_, 0, keep) == 0)
      break;
  }

  auto shown = held_.substr(0, held_.size() - keep);
  held_.erase(0, held_.size() - keep);
  return shown;
}

std::string Redactor::flush()
{
  std::string rest;
  rest.swap(held_);
  return rest;
}

SockBuffer::Conn::~Conn()
{
  if (!log_data)
    return;
  if (auto const rest = redact_in.flush(); !rest.empty())
    LOG(INFO) << "< «" << escaped(rest) << "»";
  if (auto const rest = redact_out.flush(); !rest.empty())
    LOG(INFO) << "> «" << escaped(rest) << "»";
}

// One log line per chunk, less anything held back by the redactor.
void SockBuffer::log_octets_(char const*     dir,
                             char const*     s,
                             std::streamsize n) const
{
  auto& redact = (*dir == '<') ? conn_->redact_in : conn_->redact_out;
  auto const str = redact.pass(s, static_cast<std::size_t>(n));
  if (!str.empty())
    LOG(INFO) << dir << " «" << escaped(str) << "»";
}

void SockBuffer::log_totals() const
{
  VLOG(1) << "fd " << conn_->fd << ": " << conn_->octets_read << " octets in, "
          << conn_->octets_written << " out";
}
