#include "Matrix-json.hpp"

#include <stdexcept>

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  // Examples from the Matrix appendix on canonical JSON.
  CHECK_EQ(Matrix::canonical_json(Matrix::parse_json("{}")), "{}");
  CHECK_EQ(Matrix::canonical_json(Matrix::parse_json(R"({
    "one": 1,
    "two": "Two"
})")),
           R"({"one":1,"two":"Two"})");
  CHECK_EQ(Matrix::canonical_json(Matrix::parse_json(R"({
    "b": "2",
    "a": "1"
})")),
           R"({"a":"1","b":"2"})");
  CHECK_EQ(Matrix::canonical_json(Matrix::parse_json(R"({
    "auth": {
        "success": true,
        "mxid": "@john.doe:example.com",
        "profile": {
            "display_name": "John Doe",
            "three_pids": [
                {
                    "medium": "email",
                    "address": "john.doe@example.org"
                },
                {
                    "medium": "msisdn",
                    "address": "123456789"
                }
            ]
        }
    }
})")),
           R"({"auth":{"mxid":"@john.doe:example.com","profile":{"display_name":"John Doe","three_pids":[{"address":"john.doe@example.org","medium":"email"},{"address":"123456789","medium":"msisdn"}]},"success":true}})");
  CHECK_EQ(Matrix::canonical_json(Matrix::parse_json(R"({"a": "日本語"})")),
           "{\"a\":\"日本語\"}");
  CHECK_EQ(Matrix::canonical_json(Matrix::parse_json(R"({"a": null})")),
           R"({"a":null})");

  for (auto bad : {"", "{", R"({"a":1,"a":2})", "[1 2]"}) {
    auto threw = false;
    try {
      Matrix::parse_json(bad);
    }
    catch (std::invalid_argument const&) {
      threw = true;
    }
    CHECK(threw) << bad;
  }
}
