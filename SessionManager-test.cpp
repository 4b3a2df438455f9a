#include "SessionManager.hpp"

#include <cstdlib>
#include <memory>
#include <vector>

#include <glog/logging.h>

#include "FakeHomeserver.hpp"
#include "ScriptedPrompter.hpp"

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  char tmpl[] = "/tmp/mxmail-session-XXXXXX";
  PCHECK(mkdtemp(tmpl) != nullptr);
  auto const dir = fs::path(tmpl);

  CredentialStore store{dir};
  auto const      fake = std::make_shared<FakeHomeserver>();

  std::vector<std::pair<std::string, std::string>> made;
  HomeserverFactory factory = [&made, fake](std::string const& url,
                                            std::string const& token) {
    made.emplace_back(url, token);
    return std::static_pointer_cast<Matrix::Homeserver>(fake);
  };

  SessionManager mgr{store, factory, "myhost", "me"};

  CHECK(SessionManager::is_send_name("mail"));
  CHECK(SessionManager::is_send_name("mailx"));
  CHECK(!SessionManager::is_send_name("mxmail"));
  CHECK(!SessionManager::is_send_name("Mail"));

  // Sending before setup never prompts.
  {
    ScriptedPrompter p{{}};
    auto const       r = mgr.ensure_session("mail", p);
    CHECK(std::holds_alternative<auth_error>(r));
    CHECK(std::get<auth_error>(r) == auth_error::not_logged_in);
    CHECK(p.asked.empty());
    CHECK(made.empty());
  }

  // Wrong password.
  {
    ScriptedPrompter p{{"", "me", "wrong", "", ""}};
    auto const       r = mgr.ensure_session("mxmail", p);
    CHECK(std::get<auth_error>(r) == auth_error::rejected);
    CHECK(!store.load());
  }

  // Unreachable homeserver.
  {
    fake->fail_next("login", Matrix::failure::network);
    ScriptedPrompter p{{"", "me", "hunter2", "", ""}};
    auto const       r = mgr.ensure_session("mxmail", p);
    CHECK(std::get<auth_error>(r) == auth_error::unreachable);
    CHECK(!store.load());
  }

  // Key upload refused: nothing is stored.
  {
    fake->fail_next("upload_keys", Matrix::failure::forbidden);
    ScriptedPrompter p{{"", "me", "hunter2", "", ""}};
    auto const       r = mgr.ensure_session("mxmail", p);
    CHECK(std::get<auth_error>(r) == auth_error::rejected);
    CHECK(!store.load());
  }

  // EOF at a prompt.
  {
    ScriptedPrompter p{{"", "me"}};
    auto const       r = mgr.ensure_session("mxmail", p);
    CHECK(std::get<auth_error>(r) == auth_error::rejected);
  }

  made.clear();

  // A good setup.
  {
    ScriptedPrompter p{{"", "me", "hunter2", "", ""}};
    auto const       r = mgr.ensure_session("mxmail", p);
    CHECK(std::holds_alternative<Session>(r));
    auto const& s = std::get<Session>(r);
    CHECK_EQ(s.homeserver(), "https://matrix.org");
    CHECK_EQ(s.user_id(), "@me:example.org");
    CHECK_EQ(s.access_token(), "syt_token");
    CHECK_EQ(s.device_id(), "myhost");
    CHECK_EQ(s.device_display_name(), "me@myhost");
    CHECK_EQ(fake->last_display_name, "me@myhost");
    CHECK_EQ(p.told.size(), 1u);

    // Login without a token, upload with one.
    CHECK_EQ(made.size(), 2u);
    CHECK_EQ(made[0].second, "");
    CHECK_EQ(made[1].second, "syt_token");

    // The published keys are ours and signed.
    auto const& dk = fake->uploaded_device_keys;
    CHECK_EQ(dk["device_id"].asString(), "myhost");
    CHECK_EQ(dk["keys"]["curve25519:myhost"].asString(),
             s.identity().curve25519_key());
    CHECK(Olm::verify_signed_json(dk, "@me:example.org", "ed25519:myhost",
                                  s.identity().ed25519_key()));
    CHECK_EQ(fake->uploaded_one_time_keys.size(),
             static_cast<unsigned>(Config::one_time_key_count));
  }

  // Now the send path finds it, without prompting.
  {
    ScriptedPrompter p{{}};
    auto const       r = mgr.ensure_session("mailx", p);
    CHECK(std::holds_alternative<Session>(r));
    CHECK(p.asked.empty());
    auto const stored = store.load();
    CHECK_EQ(std::get<Session>(r).identity().ed25519_key(),
             stored->identity().ed25519_key());
  }

  // Setup again replaces the stored login.
  {
    auto const before = store.load()->identity().curve25519_key();
    ScriptedPrompter p{{"", "me", "hunter2", "OTHER", ""}};
    auto const       r = mgr.ensure_session("mxmail", p);
    CHECK(std::holds_alternative<Session>(r));
    auto const after = store.load();
    CHECK_EQ(after->device_id(), "OTHER");
    CHECK_NE(after->identity().curve25519_key(), before);
  }

  error_code ec;
  fs::remove_all(dir, ec);
}
