#include "Errors.hpp"

#include <glog/logging.h>

char const* error_name(auth_error e)
{
  switch (e) {
  case auth_error::not_logged_in: return "NotLoggedIn";
  case auth_error::rejected: return "Rejected";
  case auth_error::unreachable: return "Unreachable";
  case auth_error::store_failure: return "StoreFailure";
  }
  LOG(FATAL) << "unknown auth_error";
  return "";
}

char const* error_name(resolve_error e)
{
  switch (e) {
  case resolve_error::unsupported_address_form: return "UnsupportedAddressForm";
  case resolve_error::join_denied: return "JoinDenied";
  case resolve_error::alias_not_found: return "AliasNotFound";
  case resolve_error::unreachable: return "Unreachable";
  }
  LOG(FATAL) << "unknown resolve_error";
  return "";
}

char const* error_name(send_error e)
{
  switch (e) {
  case send_error::stale_key: return "StaleKey";
  case send_error::network_failure: return "NetworkFailure";
  case send_error::unauthorized: return "Unauthorized";
  case send_error::rate_limited: return "RateLimited";
  case send_error::rejected: return "Rejected";
  case send_error::unsupported_encryption: return "UnsupportedEncryption";
  }
  LOG(FATAL) << "unknown send_error";
  return "";
}
