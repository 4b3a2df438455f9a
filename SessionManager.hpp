#ifndef SESSIONMANAGER_DOT_HPP
#define SESSIONMANAGER_DOT_HPP

#include <functional>
#include <memory>
#include <string>
#include <variant>

#include "CredentialStore.hpp"
#include "Errors.hpp"
#include "Login.hpp"
#include "Matrix.hpp"
#include "Session.hpp"

namespace Config {
constexpr auto one_time_key_count = 50;
} // namespace Config

// Makes a homeserver connection for a base URL and access token (empty
// before login).
using HomeserverFactory = std::function<std::shared_ptr<Matrix::Homeserver>(
    std::string const& homeserver,
    std::string const& access_token)>;

class SessionManager {
public:
  SessionManager(CredentialStore const& store,
                 HomeserverFactory      factory,
                 std::string            hostname,
                 std::string            login_name);

  // Invoked as mail or mailx, we send.
  static bool is_send_name(std::string const& invoked_name);

  // In send mode, the stored session or NotLoggedIn.  Under any other
  // name, an interactive login that replaces whatever was stored.
  std::variant<Session, auth_error>
  ensure_session(std::string const& invoked_name, Prompter& prompter);

private:
  std::variant<Session, auth_error> setup_(Prompter& prompter);

  CredentialStore const& store_;
  HomeserverFactory      factory_;

  std::string hostname_;
  std::string login_name_;
};

#endif // SESSIONMANAGER_DOT_HPP
