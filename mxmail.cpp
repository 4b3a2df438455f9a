// Send mail into Matrix rooms.  Run as mxmail to log in; run as mail or
// mailx (a symlink) to send what is on stdin to the rooms named on the
// command line.

#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <chrono>
#include <iostream>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include <gflags/gflags.h>

#include <glog/logging.h>

#include "Compose.hpp"
#include "CredentialStore.hpp"
#include "Deliver.hpp"
#include "Login.hpp"
#include "Matrix-HTTP.hpp"
#include "Pool.hpp"
#include "SessionManager.hpp"
#include "Trust.hpp"
#include "Url.hpp"
#include "osutil.hpp"

namespace Config {
auto constexpr timeout = 30; // seconds
} // namespace Config

DEFINE_string(s, "", "subject");

DEFINE_uint64(timeout, Config::timeout, "seconds allowed for each request to the homeserver");

DEFINE_uint32(jobs, Config::jobs, "rooms to deliver to at once");

int main(int argc, char* argv[])
{
  umask(077);

  std::ios::sync_with_stdio(false);

  { // Need to work with either namespace.
    using namespace gflags;
    using namespace google;
    SetUsageMessage("mxmail: log in\n"
                    "mail [-s subject] room... : send stdin to rooms");
    ParseCommandLineFlags(&argc, &argv, true);
  }

  google::InitGoogleLogging(argv[0]);

  auto const name = osutil::program_name(argv[0]);
  auto const send = SessionManager::is_send_name(name);

  std::vector<std::string> addresses(argv + 1, argv + argc);

  // In send mode the message is read and checked before anything else.
  Message msg;
  if (send) {
    if (addresses.empty()) {
      std::cerr << name << ": no recipients\n";
      return 1;
    }
    std::string const raw{std::istreambuf_iterator<char>(std::cin),
                          std::istreambuf_iterator<char>()};
    try {
      msg = compose(raw, FLAGS_s.empty() ? std::nullopt
                                         : std::optional<std::string>(FLAGS_s));
    }
    catch (std::invalid_argument const& e) {
      LOG(ERROR) << e.what();
      std::cerr << name << ": " << e.what() << '\n';
      return 1;
    }
  }
  else if (!addresses.empty()) {
    LOG(WARNING) << "ignoring arguments when logging in";
  }

  auto const timeout = std::chrono::seconds(FLAGS_timeout);

  HomeserverFactory factory
      = [timeout](std::string const& homeserver, std::string const& token) {
          return std::make_shared<Matrix::Client>(
              Url{homeserver}, token,
              std::chrono::duration_cast<std::chrono::milliseconds>(timeout));
        };

  CredentialStore const store{osutil::get_data_dir()};

  SessionManager mgr{store, factory, osutil::get_hostname(),
                     osutil::get_login_name()};

  TerminalPrompter prompter{std::cin, std::cout, STDIN_FILENO};

  auto const result = mgr.ensure_session(name, prompter);
  if (std::holds_alternative<auth_error>(result)) {
    auto const err = std::get<auth_error>(result);
    LOG(ERROR) << "no session: " << err;
    std::cerr << name << ": " << err << '\n';
    return 1;
  }
  if (!send)
    return 0;

  auto const& session = std::get<Session>(result);

  std::shared_ptr<Matrix::Homeserver> hs;
  try {
    hs = factory(session.homeserver(), session.access_token());
  }
  catch (std::invalid_argument const& e) {
    LOG(ERROR) << e.what();
    std::cerr << name << ": " << e.what() << '\n';
    return 1;
  }

  TrustEveryone const trust;

  auto const outcomes
      = deliver(*hs, session, trust, msg, addresses, FLAGS_jobs);

  return report(std::cerr, outcomes);
}
