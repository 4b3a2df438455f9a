#include "Sock.hpp"

#include <unistd.h>

#include <glog/logging.h>

Sock::Sock(int                       fd,
           std::function<void(void)> read_hook,
           std::chrono::milliseconds read_timeout,
           std::chrono::milliseconds write_timeout,
           std::chrono::milliseconds starttls_timeout)
  : fd_(fd)
  , iostream_(fd, read_hook, read_timeout, write_timeout, starttls_timeout)
{
  CHECK_GE(fd_, 0);
}

Sock::~Sock()
{
  iostream_->log_totals();
  if (iostream_.is_open()) {
    iostream_.close();
  }
  PLOG_IF(WARNING, close(fd_) != 0) << "close(" << fd_ << ") failed";
}
