#include "osutil.hpp"

#include <cstdlib>

#include <gflags/gflags.h>
#include <glog/logging.h>

DECLARE_string(data_dir);

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  CHECK_EQ(osutil::program_name("/usr/bin/mailx"), "mailx");
  CHECK_EQ(osutil::program_name("mail"), "mail");
  CHECK_EQ(osutil::program_name(nullptr), "");

  CHECK(!osutil::get_hostname().empty());
  CHECK(!osutil::get_home_dir().empty());

  setenv("XDG_DATA_HOME", "/tmp/xdg-data", 1);
  CHECK_EQ(osutil::get_data_dir(), fs::path("/tmp/xdg-data/mxmail"));

  unsetenv("XDG_DATA_HOME");
  setenv("HOME", "/tmp/home", 1);
  CHECK_EQ(osutil::get_data_dir(), fs::path("/tmp/home/.local/share/mxmail"));

  FLAGS_data_dir = "/tmp/elsewhere";
  CHECK_EQ(osutil::get_data_dir(), fs::path("/tmp/elsewhere"));

  setenv("USER", "alice", 1);
  CHECK_EQ(osutil::get_login_name(), "alice");
}
