#ifndef CREDENTIALSTORE_DOT_HPP
#define CREDENTIALSTORE_DOT_HPP

#include <optional>

#include "Session.hpp"
#include "fs.hpp"

namespace Config {
constexpr auto credential_file = "login";
} // namespace Config

// The one stored login, as a JSON file readable only by its owner.
class CredentialStore {
public:
  explicit CredentialStore(fs::path dir);

  fs::path const& path() const { return path_; }

  // nullopt if there is no record, or it can't be used.
  std::optional<Session> load() const;

  // Replace the record atomically; false (and logged) on any I/O
  // failure, in which case the old record is untouched.
  bool save(Session const& session) const;

  bool erase() const;

private:
  fs::path dir_;
  fs::path path_;
};

#endif // CREDENTIALSTORE_DOT_HPP
