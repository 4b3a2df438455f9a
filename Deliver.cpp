#include "Deliver.hpp"

#include <variant>

#include <glog/logging.h>

#include "Pool.hpp"
#include "Rooms.hpp"
#include "Send.hpp"

std::string Outcome::status() const
{
  if (resolve)
    return error_name(*resolve);
  if (send)
    return error_name(*send);
  return "sent";
}

std::vector<Outcome> deliver(Matrix::Homeserver&             hs,
                             Session const&                  session,
                             TrustPolicy const&              trust,
                             Message const&                  msg,
                             std::vector<std::string> const& addresses,
                             unsigned                        jobs)
{
  auto const text = msg.text();

  RoomResolver resolver{hs, session};
  Sender       sender{hs, session, trust};

  std::vector<Outcome> outcomes(addresses.size());

  Pool pool{jobs};
  for (auto i = 0u; i < addresses.size(); ++i) {
    auto& out   = outcomes[i];
    out.address = addresses[i];
    pool.submit([&resolver, &sender, &text, &out] {
      auto const r = resolver.resolve(out.address);
      if (std::holds_alternative<resolve_error>(r)) {
        out.resolve = std::get<resolve_error>(r);
        return;
      }
      out.send = sender.send(std::get<RoomHandle>(r), text);
    });
  }
  pool.wait();

  return outcomes;
}

int report(std::ostream& os, std::vector<Outcome> const& outcomes)
{
  auto failures = 0;
  for (auto const& o : outcomes) {
    if (o.sent()) {
      LOG(INFO) << o.address << ": sent";
    }
    else {
      LOG(WARNING) << o.address << ": " << o.status();
      ++failures;
    }
    os << o.address << ": " << o.status() << '\n';
  }
  return failures ? 1 : 0;
}
