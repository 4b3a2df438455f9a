#include "POSIX.hpp"

#include <glog/logging.h>

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <netdb.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <sys/types.h>

#include <fmt/format.h>

using std::chrono::duration_cast;
using std::chrono::milliseconds;
using std::chrono::nanoseconds;
using std::chrono::seconds;
using std::chrono::system_clock;

void POSIX::set_nonblocking(int fd)
{
  int flags;
  PCHECK((flags = fcntl(fd, F_GETFL, 0)) != -1);
  if (0 == (flags & O_NONBLOCK)) {
    PCHECK(fcntl(fd, F_SETFL, flags | O_NONBLOCK) != -1);
  }
}

bool POSIX::input_ready(int fd_in, milliseconds wait)
{
  auto fds{fd_set{}};
  FD_ZERO(&fds);
  FD_SET(fd_in, &fds);

  auto tv{timeval{}};
  tv.tv_sec  = duration_cast<seconds>(wait).count();
  tv.tv_usec = (wait.count() % 1000) * 1000;

  int puts;
  while ((puts = select(fd_in + 1, &fds, nullptr, nullptr, &tv)) == -1) {
    PCHECK(errno == EINTR) << "select(2) for input";
  }

  return 0 != puts;
}

bool POSIX::output_ready(int fd_out, milliseconds wait)
{
  auto fds{fd_set{}};
  FD_ZERO(&fds);
  FD_SET(fd_out, &fds);

  auto tv{timeval{}};
  tv.tv_sec  = duration_cast<seconds>(wait).count();
  tv.tv_usec = (wait.count() % 1000) * 1000;

  int puts;
  while ((puts = select(fd_out + 1, nullptr, &fds, nullptr, &tv)) == -1) {
    PCHECK(errno == EINTR) << "select(2) for output";
  }

  return 0 != puts;
}

std::streamsize POSIX::read(int                       fd,
                            char*                     s,
                            std::streamsize           n,
                            std::function<void(void)> read_hook,
                            std::chrono::milliseconds timeout,
                            bool&                     t_o)
{
  auto const end_time = system_clock::now() + timeout;

  for (;;) {
    auto const n_ret = ::read(fd, static_cast<void*>(s), n);

    if (n_ret >= 0)
      return n_ret;

    switch (errno) {
    case EINTR: continue; // try read again

    case EWOULDBLOCK:
#if EAGAIN != EWOULDBLOCK
    case EAGAIN:
#endif
      break;

    default: PLOG(WARNING) << "read(2) failed"; return -1;
    }

    auto const now = system_clock::now();
    if (now < end_time) {
      auto const time_left = duration_cast<milliseconds>(end_time - now);
      read_hook();
      if (input_ready(fd, time_left))
        continue; // try read again
    }
    t_o = true;
    LOG(WARNING) << "read(2) timed out";
    return -1;
  }
}

std::streamsize POSIX::write(int                       fd,
                             const char*               s,
                             std::streamsize           n,
                             std::chrono::milliseconds timeout,
                             bool&                     t_o)
{
  auto const end_time = system_clock::now() + timeout;

  auto written = std::streamsize{};

  for (;;) {
    auto const n_ret = ::write(fd, static_cast<const void*>(s), n - written);

    if (n_ret == -1) {
      switch (errno) {
      case EINTR: continue; // try write again

      case EWOULDBLOCK:
#if EAGAIN != EWOULDBLOCK
      case EAGAIN:
#endif
        break;

      default: PLOG(WARNING) << "write(2) failed"; return -1;
      }
    }
    else {
      s += n_ret;
      written += n_ret;
    }

    if (written == n)
      return n;

    auto const now = system_clock::now();
    if (now < end_time) {
      auto const time_left = duration_cast<milliseconds>(end_time - now);
      if (output_ready(fd, time_left))
        continue; // write some more
    }
    t_o = true;
    LOG(WARNING) << "write(2) timed out";
    return -1;
  }
}

int POSIX::connect(std::string const&        node,
                   uint16_t                  port,
                   std::chrono::milliseconds timeout)
{
  auto const end_time = system_clock::now() + timeout;

  auto hints{addrinfo{}};
  hints.ai_family   = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;

  auto const service = fmt::format("{}", port);

  auto req{gaicb{}};
  req.ar_name    = node.c_str();
  req.ar_service = service.c_str();
  req.ar_request = &hints;

  gaicb* reqs[] = {&req};
  if (auto const rc = getaddrinfo_a(GAI_NOWAIT, reqs, 1, nullptr); rc != 0) {
    LOG(WARNING) << "can't resolve " << node << ": " << gai_strerror(rc);
    return -1;
  }

  int rc;
  while ((rc = gai_error(&req)) == EAI_INPROGRESS) {
    auto const now = system_clock::now();
    if (now >= end_time) {
      if (gai_cancel(&req) == EAI_NOTCANCELED) {
        // A resolver thread still writes to req; it can't go out of scope
        // before that finishes.
        while (gai_error(&req) == EAI_INPROGRESS)
          gai_suspend(reqs, 1, nullptr);
      }
      if (req.ar_result != nullptr)
        freeaddrinfo(req.ar_result);
      LOG(WARNING) << "resolving " << node << " timed out";
      return -1;
    }
    auto const left = end_time - now;
    auto       ts{timespec{}};
    ts.tv_sec  = duration_cast<seconds>(left).count();
    ts.tv_nsec = duration_cast<nanoseconds>(left % seconds(1)).count();
    gai_suspend(reqs, 1, &ts); // EAI_AGAIN on timeout, EAI_INTR on signal
  }
  if (rc != 0) {
    LOG(WARNING) << "can't resolve " << node << ": " << gai_strerror(rc);
    return -1;
  }

  auto const res = req.ar_result;

  int fd = -1;
  for (auto ai = res; ai != nullptr; ai = ai->ai_next) {
    fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (fd == -1) {
      PLOG(WARNING) << "socket() failed";
      continue;
    }
    set_nonblocking(fd);

    if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0)
      break;

    if (errno == EINPROGRESS) {
      auto const now = system_clock::now();
      if (now < end_time
          && output_ready(fd, duration_cast<milliseconds>(end_time - now))) {
        int       so_error = 0;
        socklen_t len      = sizeof so_error;
        PCHECK(getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) == 0);
        if (so_error == 0)
          break;
        LOG(WARNING) << "connect to " << node << ":" << port
                     << " failed: " << strerror(so_error);
      }
      else {
        LOG(WARNING) << "connect to " << node << ":" << port << " timed out";
      }
    }
    else {
      PLOG(WARNING) << "connect to " << node << ":" << port << " failed";
    }
    close(fd);
    fd = -1;
  }

  freeaddrinfo(res);
  return fd;
}

POSIX::no_echo::no_echo(int fd)
  : fd_(fd)
{
  if (fd_ < 0 || !isatty(fd_))
    return;
  if (tcgetattr(fd_, &saved_) != 0) {
    PLOG(WARNING) << "tcgetattr failed";
    return;
  }
  auto quiet = saved_;
  quiet.c_lflag &= ~ECHO;
  if (tcsetattr(fd_, TCSAFLUSH, &quiet) != 0) {
    PLOG(WARNING) << "tcsetattr failed";
    return;
  }
  active_ = true;
}

POSIX::no_echo::~no_echo()
{
  if (active_) {
    PLOG_IF(WARNING, tcsetattr(fd_, TCSAFLUSH, &saved_) != 0)
        << "can't restore terminal echo";
  }
}
