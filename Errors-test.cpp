#include "Errors.hpp"

#include <sstream>
#include <string>

#include <glog/logging.h>

#include "Matrix.hpp"

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  using Matrix::classify;
  using Matrix::failure;

  CHECK(classify(401, "") == failure::unauthorized);
  CHECK(classify(401, "M_UNKNOWN_TOKEN") == failure::unauthorized);
  CHECK(classify(400, "M_MISSING_TOKEN") == failure::unauthorized);
  CHECK(classify(403, "M_FORBIDDEN") == failure::forbidden);
  CHECK(classify(403, "") == failure::forbidden);
  CHECK(classify(404, "M_NOT_FOUND") == failure::not_found);
  CHECK(classify(404, "M_UNRECOGNIZED") == failure::not_found);
  CHECK(classify(429, "M_LIMIT_EXCEEDED") == failure::rate_limited);
  CHECK(classify(400, "M_LIMIT_EXCEEDED") == failure::rate_limited);
  CHECK(classify(502, "") == failure::network);
  CHECK(classify(500, "M_UNKNOWN") == failure::rejected);
  CHECK(classify(400, "M_BAD_JSON") == failure::rejected);
  CHECK(classify(413, "M_TOO_LARGE") == failure::rejected);

  Matrix::Error const e{failure::forbidden, 403, "M_FORBIDDEN", "nope"};
  CHECK(e.kind() == failure::forbidden);
  CHECK_EQ(e.status(), 403);
  CHECK_EQ(e.errcode(), "M_FORBIDDEN");
  CHECK_EQ(std::string(e.what()), "nope");

  std::ostringstream os;
  os << auth_error::not_logged_in << ' ' << resolve_error::alias_not_found
     << ' ' << send_error::stale_key << ' ' << failure::rate_limited;
  CHECK_EQ(os.str(), "NotLoggedIn AliasNotFound StaleKey rate_limited");

  CHECK_EQ(std::string(error_name(auth_error::store_failure)), "StoreFailure");
  CHECK_EQ(std::string(error_name(resolve_error::unsupported_address_form)),
           "UnsupportedAddressForm");
  CHECK_EQ(std::string(error_name(send_error::unsupported_encryption)),
           "UnsupportedEncryption");
  CHECK_EQ(std::string(Matrix::membership_name(Matrix::membership::invited)),
           "invited");
}
