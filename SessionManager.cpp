#include "SessionManager.hpp"

#include <stdexcept>

#include <fmt/format.h>

#include <glog/logging.h>

SessionManager::SessionManager(CredentialStore const& store,
                               HomeserverFactory      factory,
                               std::string            hostname,
                               std::string            login_name)
  : store_(store)
  , factory_(std::move(factory))
  , hostname_(std::move(hostname))
  , login_name_(std::move(login_name))
{
}

bool SessionManager::is_send_name(std::string const& invoked_name)
{
  return invoked_name == "mail" || invoked_name == "mailx";
}

std::variant<Session, auth_error>
SessionManager::ensure_session(std::string const& invoked_name,
                               Prompter&          prompter)
{
  if (!is_send_name(invoked_name)) {
    return setup_(prompter);
  }

  auto session = store_.load();
  if (!session) {
    LOG(WARNING) << "not logged in; run setup first";
    return auth_error::not_logged_in;
  }
  LOG(INFO) << "using " << session->user_id() << " device "
            << session->device_id() << " on " << session->homeserver();
  return std::move(*session);
}

// Login, then make and publish the device keys, then store it all.
// Nothing is stored unless every step worked.
std::variant<Session, auth_error> SessionManager::setup_(Prompter& prompter)
{
  auto answers = ask_login(prompter, login_steps(hostname_, login_name_));
  if (!answers) {
    return auth_error::rejected;
  }

  try {
    auto const anon = factory_(answers->homeserver, "");
    auto const login
        = anon->login(answers->user, answers->password, answers->device_name,
                      answers->display_name);
    answers->password.clear();
    LOG(INFO) << "logged in as " << login.user_id << " device "
              << login.device_id;

    DeviceIdentity identity{login.device_id, Olm::Account{}};
    auto const     device_keys
        = identity.account.device_keys(login.user_id, login.device_id);
    auto const one_time_keys = identity.account.generate_one_time_keys(
        Config::one_time_key_count, login.user_id, login.device_id);

    auto const hs = factory_(answers->homeserver, login.access_token);
    hs->upload_keys(device_keys, one_time_keys);

    Session session{answers->homeserver, login.user_id, login.access_token,
                    std::move(identity), answers->display_name};
    if (!store_.save(session)) {
      return auth_error::store_failure;
    }

    prompter.tell(fmt::format("Logged in as {} (device {}).", session.user_id(),
                              session.device_id()));
    return session;
  }
  catch (Matrix::Error const& e) {
    LOG(WARNING) << "setup failed: " << e.what();
    return e.kind() == Matrix::failure::network ? auth_error::unreachable
                                                : auth_error::rejected;
  }
  catch (std::invalid_argument const& e) {
    LOG(WARNING) << "setup failed: " << e.what();
    return auth_error::rejected;
  }
}
