#include "Url.hpp"

#include <stdexcept>

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  CHECK_EQ(Url::normalize("matrix.org"), "https://matrix.org");
  CHECK_EQ(Url::normalize("http://localhost:8008"), "http://localhost:8008");
  CHECK_EQ(Url::normalize("HTTPS://Example.COM"), "HTTPS://Example.COM");

  Url mo{"https://matrix.org"};
  CHECK_EQ(mo.scheme(), "https");
  CHECK_EQ(mo.host(), "matrix.org");
  CHECK_EQ(mo.port(), 443);
  CHECK_EQ(mo.path(), "");
  CHECK(mo.tls());
  CHECK_EQ(mo.authority(), "matrix.org");
  CHECK_EQ(mo.as_string(), "https://matrix.org");

  Url local{"http://LocalHost:8008/"};
  CHECK_EQ(local.scheme(), "http");
  CHECK_EQ(local.host(), "localhost");
  CHECK_EQ(local.port(), 8008);
  CHECK_EQ(local.path(), "");
  CHECK(!local.tls());
  CHECK_EQ(local.authority(), "localhost:8008");

  Url prefixed{"https://example.com/matrix/"};
  CHECK_EQ(prefixed.path(), "/matrix");
  CHECK_EQ(prefixed.as_string(), "https://example.com/matrix");

  Url v6{"http://[::1]:8448"};
  CHECK_EQ(v6.host(), "::1");
  CHECK_EQ(v6.authority(), "[::1]:8448");

  for (auto bad : {"matrix.org", "ftp://matrix.org", "https://", "https://a:99999",
                   "https://a b", "https://host/?q=1"}) {
    auto threw = false;
    try {
      Url u{bad};
    }
    catch (std::invalid_argument const&) {
      threw = true;
    }
    CHECK(threw) << bad;
  }

  CHECK_EQ(Url::percent_encode("#room:example.org"), "%23room%3Aexample.org");
  CHECK_EQ(Url::percent_encode("!abc:ex.org"), "%21abc%3Aex.org");
  CHECK_EQ(Url::percent_encode("@me:ex.org"), "%40me%3Aex.org");
  CHECK_EQ(Url::percent_encode("a-b_c.d~e"), "a-b_c.d~e");
  CHECK_EQ(Url::percent_encode("caf\xC3\xA9"), "caf%C3%A9");
}
