#ifndef OSUTIL_DOT_HPP
#define OSUTIL_DOT_HPP

#include <string>
#include <string_view>

#include "fs.hpp"

namespace osutil {
fs::path    get_data_dir();
fs::path    get_home_dir();
std::string get_hostname();
std::string get_login_name();
std::string program_name(char const* argv0);
} // namespace osutil

#endif // OSUTIL_DOT_HPP
