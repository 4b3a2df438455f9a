#include "CredentialStore.hpp"

#include <cerrno>
#include <fstream>
#include <iterator>
#include <stdexcept>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <fmt/format.h>

#include <glog/logging.h>

#include "Matrix-json.hpp"
#include "Pill.hpp"

namespace {
bool write_all(int fd, std::string const& data)
{
  auto p    = data.data();
  auto left = data.size();
  while (left) {
    auto const n = ::write(fd, p, left);
    if (n == -1) {
      if (errno == EINTR)
        continue;
      return false;
    }
    p += n;
    left -= static_cast<size_t>(n);
  }
  return true;
}

bool sync_dir(fs::path const& dir)
{
  auto const fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
  if (fd == -1)
    return false;
  auto const ok = fsync(fd) == 0;
  close(fd);
  return ok;
}
} // namespace

CredentialStore::CredentialStore(fs::path dir)
  : dir_(std::move(dir))
  , path_(dir_ / Config::credential_file)
{
}

std::optional<Session> CredentialStore::load() const
{
  std::ifstream ifs(path_);
  if (!ifs) {
    VLOG(1) << "no credential record at " << path_;
    return {};
  }

  std::string const text{std::istreambuf_iterator<char>(ifs),
                         std::istreambuf_iterator<char>()};
  try {
    auto session = Session::from_json(Matrix::parse_json(text));
    if (!session) {
      LOG(WARNING) << "ignoring unusable credential record " << path_;
      return {};
    }
    if (!session->authenticated()) {
      LOG(WARNING) << "credential record " << path_ << " holds no login";
      return {};
    }
    return session;
  }
  catch (std::invalid_argument const& e) {
    LOG(WARNING) << "ignoring credential record " << path_ << ": " << e.what();
  }
  return {};
}

bool CredentialStore::save(Session const& session) const
{
  error_code ec;
  create_directories(dir_, ec);
  if (ec) {
    LOG(ERROR) << "can't create " << dir_ << ": " << ec.message();
    return false;
  }
  permissions(dir_, fs::perms::owner_all, fs::perm_options::replace, ec);
  if (ec) {
    LOG(ERROR) << "can't restrict " << dir_ << ": " << ec.message();
    return false;
  }

  auto const tmpfn
      = dir_ / fmt::format(".{}.{}", Config::credential_file, Pill{}.as_string());
  auto const text = Matrix::canonical_json(session.to_json());

  auto const fd = ::open(tmpfn.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC,
                         S_IRUSR | S_IWUSR);
  if (fd == -1) {
    PLOG(ERROR) << "can't create " << tmpfn;
    return false;
  }
  auto const written = write_all(fd, text) && fsync(fd) == 0;
  if (!written)
    PLOG(ERROR) << "can't write " << tmpfn;
  if (close(fd) != 0 && written) {
    PLOG(ERROR) << "can't close " << tmpfn;
    fs::remove(tmpfn, ec);
    return false;
  }
  if (!written) {
    fs::remove(tmpfn, ec);
    return false;
  }

  fs::rename(tmpfn, path_, ec);
  if (ec) {
    LOG(ERROR) << "can't rename " << tmpfn << " to " << path_ << ": "
               << ec.message();
    fs::remove(tmpfn, ec);
    return false;
  }
  if (!sync_dir(dir_)) {
    PLOG(WARNING) << "can't sync " << dir_;
  }
  return true;
}

bool CredentialStore::erase() const
{
  error_code ec;
  fs::remove(path_, ec);
  if (ec) {
    LOG(ERROR) << "can't remove " << path_ << ": " << ec.message();
    return false;
  }
  return true;
}
