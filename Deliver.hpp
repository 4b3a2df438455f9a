#ifndef DELIVER_DOT_HPP
#define DELIVER_DOT_HPP

#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "Compose.hpp"
#include "Errors.hpp"
#include "Matrix.hpp"
#include "Session.hpp"
#include "Trust.hpp"

// How delivery to one address went.
struct Outcome {
  std::string address;

  std::optional<resolve_error> resolve;
  std::optional<send_error>    send;

  bool sent() const { return !resolve && !send; }

  // "sent" or the error name.
  std::string status() const;
};

// Resolve and send to every address, jobs at a time.  One outcome per
// address, in the order given; a failure for one address has no effect
// on the others.
std::vector<Outcome> deliver(Matrix::Homeserver&             hs,
                             Session const&                  session,
                             TrustPolicy const&              trust,
                             Message const&                  msg,
                             std::vector<std::string> const& addresses,
                             unsigned                        jobs);

// One "<address>: <status>" line each; returns the exit status, zero only
// if everything was sent.
int report(std::ostream& os, std::vector<Outcome> const& outcomes);

#endif // DELIVER_DOT_HPP
