#ifndef POSIX_DOT_HPP
#define POSIX_DOT_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <ios>
#include <string>

#include <termios.h>
#include <unistd.h>

class POSIX {
public:
  POSIX()             = delete;
  POSIX(POSIX const&) = delete;

  static void set_nonblocking(int fd);

  static bool input_ready(int fd_in, std::chrono::milliseconds wait);
  static bool output_ready(int fd_out, std::chrono::milliseconds wait);

  static std::streamsize read(int                       fd,
                              char*                     s,
                              std::streamsize           n,
                              std::function<void(void)> read_hook,
                              std::chrono::milliseconds timeout,
                              bool&                     t_o);

  static std::streamsize write(int                       fd,
                               const char*               s,
                               std::streamsize           n,
                               std::chrono::milliseconds timeout,
                               bool&                     t_o);

  // Resolve node and open a TCP connection to the first address that
  // answers, the lookup and all attempts together within timeout.
  // Returns -1 on failure.
  static int connect(std::string const&        node,
                     uint16_t                  port,
                     std::chrono::milliseconds timeout);

  // Turn off terminal echo on fd for the lifetime of the object, used
  // when reading a password.  Does nothing if fd is not a terminal.
  class no_echo {
  public:
    no_echo(no_echo const&) = delete;
    no_echo& operator=(no_echo const&) = delete;

    explicit no_echo(int fd);
    ~no_echo();

    bool active() const { return active_; }

  private:
    int     fd_;
    termios saved_{};
    bool    active_{false};
  };
};

#endif // POSIX_DOT_HPP
