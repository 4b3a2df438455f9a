#ifndef ERRORS_DOT_HPP
#define ERRORS_DOT_HPP

#include <ostream>

// Outcomes reported to the user.  An auth_error ends the run; the others
// belong to one address and are collected for the final report.

enum class auth_error {
  not_logged_in,
  rejected,
  unreachable,
  store_failure,
};

enum class resolve_error {
  unsupported_address_form,
  join_denied,
  alias_not_found,
  unreachable,
};

enum class send_error {
  stale_key,
  network_failure,
  unauthorized,
  rate_limited,
  rejected,
  unsupported_encryption,
};

char const* error_name(auth_error e);
char const* error_name(resolve_error e);
char const* error_name(send_error e);

inline std::ostream& operator<<(std::ostream& os, auth_error e)
{
  return os << error_name(e);
}
inline std::ostream& operator<<(std::ostream& os, resolve_error e)
{
  return os << error_name(e);
}
inline std::ostream& operator<<(std::ostream& os, send_error e)
{
  return os << error_name(e);
}

#endif // ERRORS_DOT_HPP
