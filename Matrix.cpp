#include "Matrix.hpp"

#include <glog/logging.h>

namespace Matrix {

char const* failure_name(failure f)
{
  switch (f) {
  case failure::network: return "network";
  case failure::unauthorized: return "unauthorized";
  case failure::forbidden: return "forbidden";
  case failure::not_found: return "not_found";
  case failure::rate_limited: return "rate_limited";
  case failure::rejected: return "rejected";
  }
  LOG(FATAL) << "unknown failure kind";
  return "";
}

char const* membership_name(membership m)
{
  switch (m) {
  case membership::none: return "none";
  case membership::invited: return "invited";
  case membership::joined: return "joined";
  }
  LOG(FATAL) << "unknown membership";
  return "";
}

failure classify(int status, std::string const& errcode)
{
  if (errcode == "M_UNKNOWN_TOKEN" || errcode == "M_MISSING_TOKEN"
      || status == 401)
    return failure::unauthorized;
  if (errcode == "M_LIMIT_EXCEEDED" || status == 429)
    return failure::rate_limited;
  if (errcode == "M_NOT_FOUND" || status == 404)
    return failure::not_found;
  if (errcode == "M_FORBIDDEN" || status == 403)
    return failure::forbidden;
  if (status >= 500 && errcode.empty())
    return failure::network;
  return failure::rejected;
}

} // namespace Matrix
