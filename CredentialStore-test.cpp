#include "CredentialStore.hpp"

#include <cstdlib>
#include <fstream>

#include <sys/stat.h>

#include <glog/logging.h>

#include "Matrix-json.hpp"

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  char tmpl[] = "/tmp/mxmail-store-XXXXXX";
  PCHECK(mkdtemp(tmpl) != nullptr);
  auto const top = fs::path(tmpl);
  auto const dir = top / "mxmail";

  CredentialStore store{dir};
  CHECK_EQ(store.path(), dir / "login");
  CHECK(!store.load());

  Session const s{"https://example.org", "@me:example.org", "secret-token",
                  DeviceIdentity{"DEV", Olm::Account{}}, "me@host"};
  CHECK(store.save(s));

  auto const loaded = store.load();
  CHECK(loaded);
  CHECK_EQ(loaded->user_id(), "@me:example.org");
  CHECK_EQ(loaded->access_token(), "secret-token");
  CHECK_EQ(loaded->device_id(), "DEV");
  CHECK_EQ(loaded->identity().curve25519_key(), s.identity().curve25519_key());

  struct stat st;
  PCHECK(stat(store.path().c_str(), &st) == 0);
  CHECK_EQ(st.st_mode & 0777, 0600u);
  PCHECK(stat(dir.c_str(), &st) == 0);
  CHECK_EQ(st.st_mode & 0777, 0700u);

  // Overwrite leaves just the one file.
  Session const again{"https://example.org", "@me:example.org", "new-token",
                      DeviceIdentity{"DEV2", Olm::Account{}}, "me@host"};
  CHECK(store.save(again));
  CHECK_EQ(store.load()->access_token(), "new-token");
  auto files = 0;
  for (auto const& entry : fs::directory_iterator(dir)) {
    CHECK_EQ(entry.path().filename().string(), "login");
    ++files;
  }
  CHECK_EQ(files, 1);

  // A record with a token but no device is no record at all.
  auto partial         = again.to_json();
  partial["device_id"] = "";
  {
    std::ofstream ofs(store.path());
    ofs << Matrix::canonical_json(partial);
  }
  CHECK(!store.load());

  {
    std::ofstream ofs(store.path());
    ofs << "{ not json";
  }
  CHECK(!store.load());

  // A logged out record is not a session either.
  {
    std::ofstream ofs(store.path());
    ofs << Matrix::canonical_json(Session{"https://example.org"}.to_json());
  }
  CHECK(!store.load());

  CHECK(store.erase());
  CHECK(!fs::exists(store.path()));
  CHECK(!store.load());

  error_code ec;
  fs::remove_all(top, ec);
}
