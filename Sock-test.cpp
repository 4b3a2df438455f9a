#include "Sock.hpp"

#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <cstring>
#include <string>
#include <thread>

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  {
    Redactor r;
    r.set_secret("syt_sekrit");

    std::string shown;
    for (auto chunk : {"Authorization: Bearer syt_se", "k", "rit\r\nHost: h"}) {
      shown += r.pass(chunk, strlen(chunk));
      CHECK_EQ(shown.find("syt_"), std::string::npos);
    }
    shown += r.flush();
    CHECK_EQ(shown, "Authorization: Bearer <redacted>\r\nHost: h");

    // A start of the secret that goes nowhere is shown in the end.
    CHECK_EQ(r.pass("xsyt", 4), "x");
    CHECK_EQ(r.pass("!", 1), "syt!");
    CHECK_EQ(r.pass("syt_s", 5), "");
    CHECK_EQ(r.flush(), "syt_s");

    // Back to back, and a secret inside the mask itself.
    CHECK_EQ(r.pass("syt_sekritsyt_sekrit.", 21), "<redacted><redacted>.");
    Redactor odd;
    odd.set_secret("red");
    CHECK_EQ(odd.pass("red", 3), "<redacted>");
    CHECK_EQ(odd.flush(), "");

    Redactor none;
    CHECK_EQ(none.pass("plain", 5), "plain");
  }

  int sv[2];
  PCHECK(socketpair(AF_UNIX, SOCK_STREAM, 0, sv) == 0);

  auto hooks = 0;
  {
    Sock sock(
        sv[0], [&hooks] { ++hooks; }, std::chrono::milliseconds(100));
    sock.set_redact("sekrit");
    CHECK(!sock.tls());
    CHECK_EQ(sock.tls_info(), "");

    std::string const hello{"hello sekrit\r\n"};
    PCHECK(write(sv[1], hello.data(), hello.size())
           == static_cast<ssize_t>(hello.size()));
    CHECK(sock.input_ready(std::chrono::milliseconds(100)));

    std::string line;
    CHECK(std::getline(sock.in(), line));
    CHECK_EQ(line, "hello sekrit\r");

    sock.out() << "world\n" << std::flush;
    char bfr[16];
    auto const n = read(sv[1], bfr, sizeof(bfr));
    CHECK_EQ(std::string(bfr, n), "world\n");

    // Nothing more to read: the read times out.
    CHECK(!sock.input_ready(std::chrono::milliseconds(10)));
    CHECK(!std::getline(sock.in(), line));
    CHECK(sock.timed_out());
    CHECK_GE(hooks, 1);
  }

  // The Sock closed its end.
  char c;
  CHECK_EQ(read(sv[1], &c, 1), 0);
  close(sv[1]);

  // A peer sending a byte well within each read timeout still runs
  // into the deadline.
  PCHECK(socketpair(AF_UNIX, SOCK_STREAM, 0, sv) == 0);
  std::atomic<bool> stop{false};
  std::thread       trickle([&] {
    while (!stop) {
      if (send(sv[1], "x", 1, MSG_NOSIGNAL) != 1)
        break;
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
  });
  {
    using namespace std::chrono;

    Sock sock(sv[0], [] {}, milliseconds(200));
    auto const start = steady_clock::now();
    sock.set_deadline(start + milliseconds(300));

    std::string line;
    std::getline(sock.in(), line);
    CHECK(sock.in().eof());
    CHECK(sock.timed_out());
    CHECK(steady_clock::now() - start < milliseconds(1000));
    CHECK(!line.empty());
  }
  stop = true;
  trickle.join();
  close(sv[1]);
}
