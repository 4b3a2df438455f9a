#ifndef FS_DOT_HPP
#define FS_DOT_HPP

// Short namespace alias for the filesystem library, used by everything
// that touches the state directory.

#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;
using std::error_code;

#endif // FS_DOT_HPP
