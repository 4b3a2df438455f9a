#include "POSIX.hpp"

#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <string>

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  int sv[2];
  PCHECK(socketpair(AF_UNIX, SOCK_STREAM, 0, sv) == 0);

  POSIX::set_nonblocking(sv[0]);
  POSIX::set_nonblocking(sv[1]);

  CHECK(!POSIX::input_ready(sv[0], std::chrono::milliseconds(1)));
  CHECK(POSIX::output_ready(sv[1], std::chrono::milliseconds(1)));

  auto t_o = false;
  CHECK_EQ(POSIX::write(sv[1], "ping", 4, std::chrono::seconds(1), t_o), 4);
  CHECK(!t_o);
  CHECK(POSIX::input_ready(sv[0], std::chrono::milliseconds(100)));

  char buf[8];
  auto const n = POSIX::read(
      sv[0], buf, sizeof(buf), []() {}, std::chrono::seconds(1), t_o);
  CHECK_EQ(n, 4);
  CHECK_EQ(std::string(buf, 4), "ping");

  POSIX::read(sv[0], buf, sizeof(buf), []() {}, std::chrono::milliseconds(10),
              t_o);
  CHECK(t_o);

  // Nothing listens on port 1 of the loopback interface.
  CHECK_EQ(POSIX::connect("127.0.0.1", 1, std::chrono::seconds(1)), -1);

  // A listener on an ephemeral loopback port.
  auto const lfd = socket(AF_INET, SOCK_STREAM, 0);
  PCHECK(lfd != -1);
  auto sin{sockaddr_in{}};
  sin.sin_family      = AF_INET;
  sin.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  PCHECK(bind(lfd, reinterpret_cast<sockaddr*>(&sin), sizeof(sin)) == 0);
  PCHECK(listen(lfd, 1) == 0);
  socklen_t len = sizeof(sin);
  PCHECK(getsockname(lfd, reinterpret_cast<sockaddr*>(&sin), &len) == 0);
  auto const port = ntohs(sin.sin_port);

  auto const cfd = POSIX::connect("127.0.0.1", port, std::chrono::seconds(1));
  CHECK_NE(cfd, -1);
  close(cfd);
  close(lfd);

  // No terminal here, so no-op.
  POSIX::no_echo quiet(sv[0]);
  CHECK(!quiet.active());

  close(sv[0]);
  close(sv[1]);
}
