#include "osutil.hpp"

#include <cerrno>
#include <cstdlib>

#include <pwd.h>
#include <sys/types.h>
#include <sys/utsname.h>
#include <unistd.h>

#include <gflags/gflags.h>

DEFINE_string(data_dir, "", "directory holding the stored login");

#include <glog/logging.h>

namespace osutil {

fs::path get_data_dir()
{
  if (!FLAGS_data_dir.empty()) {
    return FLAGS_data_dir;
  }

  // <https://specifications.freedesktop.org/basedir-spec/latest/>
  auto const xdg_ev{getenv("XDG_DATA_HOME")};
  if (xdg_ev && *xdg_ev) {
    return fs::path(xdg_ev) / "mxmail";
  }
  return get_home_dir() / ".local" / "share" / "mxmail";
}

fs::path get_home_dir()
{
  auto const homedir_ev{getenv("HOME")};
  if (homedir_ev) {
    return homedir_ev;
  }
  else {
    errno = 0; // See GETPWNAM(3)
    passwd* pw;
    PCHECK(pw = getpwuid(getuid()));
    return pw->pw_dir;
  }
}

std::string get_hostname()
{
  utsname un;
  PCHECK(uname(&un) == 0);
  return std::string(un.nodename);
}

std::string get_login_name()
{
  auto const user_ev{getenv("USER")};
  if (user_ev && *user_ev) {
    return user_ev;
  }
  errno = 0;
  if (auto const pw = getpwuid(getuid()); pw) {
    return pw->pw_name;
  }
  PLOG(WARNING) << "getpwuid failed";
  return "";
}

// The name we were invoked as, which selects setup or send mode.
std::string program_name(char const* argv0)
{
  if (argv0 == nullptr)
    return "";
  return fs::path(argv0).filename().string();
}

} // namespace osutil
