#include "HTTP.hpp"

#include <sstream>
#include <thread>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <glog/logging.h>

namespace {
void check_parsing()
{
  std::ostringstream os;
  HTTP::Request      req{"PUT", "/x", {{"Content-Type", "application/json"}}, "{}"};
  HTTP::write_request(os, req);
  CHECK_EQ(os.str(), "PUT /x HTTP/1.1\r\nContent-Type: application/json\r\n\r\n{}");

  std::istringstream cl{"HTTP/1.1 200 OK\r\n"
                        "Content-Type: application/json\r\n"
                        "Content-Length: 2\r\n"
                        "\r\n"
                        "{}trailing"};
  auto const r1 = HTTP::read_response(cl);
  CHECK(r1);
  CHECK_EQ(r1->status, 200);
  CHECK_EQ(r1->reason, "OK");
  CHECK_EQ(r1->body, "{}");
  CHECK_EQ(*r1->header("CONTENT-TYPE"), "application/json");
  CHECK(!r1->header("x-missing"));

  std::istringstream chunked{"HTTP/1.1 404 Not Found\r\n"
                             "Transfer-Encoding: chunked\r\n"
                             "X-Dup: a\r\n"
                             "x-dup: b  \r\n"
                             "\r\n"
                             "4;ext=1\r\n{\"er\r\n"
                             "A\r\nrcode\":1}\n\r\n"
                             "0\r\n"
                             "\r\n"};
  auto const r2 = HTTP::read_response(chunked);
  CHECK(r2);
  CHECK_EQ(r2->status, 404);
  CHECK_EQ(r2->body, "{\"errcode\":1}\n");
  CHECK_EQ(*r2->header("x-dup"), "a, b");

  std::istringstream eof{"HTTP/1.0 500\r\n\r\nall the rest"};
  auto const r3 = HTTP::read_response(eof);
  CHECK(r3);
  CHECK_EQ(r3->status, 500);
  CHECK_EQ(r3->reason, "");
  CHECK_EQ(r3->body, "all the rest");

  std::istringstream no_content{"HTTP/1.1 204 No Content\r\n\r\n"};
  CHECK(HTTP::read_response(no_content));

  for (auto bad : {"", "SMTP/1.1 200 OK\r\n\r\n", "HTTP/1.1 20 OK\r\n\r\n",
                   "HTTP/1.1 200 OK\r\nno colon\r\n\r\n",
                   "HTTP/1.1 200 OK\r\nContent-Length: 10\r\n\r\nshort",
                   "HTTP/1.1 200 OK\r\nContent-Length: x\r\n\r\n",
                   "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\nzz\r\n",
                   "HTTP/1.1 200 OK\r\nContent-Type: x\r\n"}) {
    std::istringstream is{bad};
    CHECK(!HTTP::read_response(is)) << bad;
  }
}

// One canned exchange over loopback.
void check_client()
{
  auto const lfd = socket(AF_INET, SOCK_STREAM, 0);
  PCHECK(lfd >= 0);
  auto addr{sockaddr_in{}};
  addr.sin_family      = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  addr.sin_port        = 0;
  PCHECK(bind(lfd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
  PCHECK(listen(lfd, 1) == 0);
  socklen_t len = sizeof(addr);
  PCHECK(getsockname(lfd, reinterpret_cast<sockaddr*>(&addr), &len) == 0);
  auto const port = ntohs(addr.sin_port);

  std::string received;
  std::thread server([lfd, &received]() {
    auto const fd = accept(lfd, nullptr, nullptr);
    PCHECK(fd >= 0);
    char bfr[4096];
    while (received.find("\r\n\r\n") == std::string::npos
           || received.substr(received.size() - 2) != "{}") {
      auto const n = read(fd, bfr, sizeof(bfr));
      PCHECK(n > 0);
      received.append(bfr, static_cast<size_t>(n));
    }
    std::string const rsp{"HTTP/1.1 200 OK\r\n"
                          "Content-Length: 17\r\n"
                          "\r\n"
                          "{\"event_id\":\"$e\"}"};
    PCHECK(write(fd, rsp.data(), rsp.size()) == ssize_t(rsp.size()));
    close(fd);
  });

  HTTP::Client client{Url{"http://127.0.0.1:" + std::to_string(port) + "/base"},
                      std::chrono::seconds(5)};
  HTTP::Request req{"PUT", "/_matrix/x", {{"Authorization", "Bearer sekrit"}}, "{}"};
  auto const rsp = client.exchange(req, "sekrit");
  server.join();
  close(lfd);

  CHECK(rsp);
  CHECK_EQ(rsp->status, 200);
  CHECK_EQ(rsp->body, "{\"event_id\":\"$e\"}");

  CHECK_EQ(received.find("PUT /base/_matrix/x HTTP/1.1\r\n"), 0u);
  CHECK_NE(received.find("Host: 127.0.0.1:" + std::to_string(port) + "\r\n"),
           std::string::npos);
  CHECK_NE(received.find("Connection: close\r\n"), std::string::npos);
  CHECK_NE(received.find("Content-Length: 2\r\n"), std::string::npos);
  CHECK_NE(received.find("Authorization: Bearer sekrit\r\n"), std::string::npos);

  // Nothing is listening there any more.
  CHECK(!client.exchange(req));
}
} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  check_parsing();
  check_client();
}
