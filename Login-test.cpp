#include "Login.hpp"

#include <sstream>

#include <glog/logging.h>

#include "ScriptedPrompter.hpp"

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  auto const steps = login_steps("myhost", "alice");

  // All defaults.
  {
    ScriptedPrompter p{{"", "alice", "pw", "", ""}};
    auto const       a = ask_login(p, steps);
    CHECK(a);
    CHECK_EQ(a->homeserver, "https://matrix.org");
    CHECK_EQ(a->user, "alice");
    CHECK_EQ(a->password, "pw");
    CHECK_EQ(a->device_name, "myhost");
    CHECK_EQ(a->display_name, "alice@myhost");

    CHECK_EQ(p.asked.size(), 5u);
    CHECK_EQ(p.asked[0].first, "Homeserver (default: matrix.org): ");
    CHECK_EQ(p.asked[1].first, "User: ");
    CHECK_EQ(p.asked[2].first, "Password: ");
    CHECK_EQ(p.asked[3].first, "Device name (default: myhost): ");
    CHECK_EQ(p.asked[4].first, "Display name (default: alice@myhost): ");
    CHECK(!p.asked[0].second);
    CHECK(p.asked[2].second);
    CHECK(!p.asked[3].second);
  }

  // Everything given; the display name default follows the device name.
  {
    ScriptedPrompter p{{"http://localhost:8008/", "@bob:localhost", "pw",
                        "PHONE", "Bob's phone"}};
    auto const       a = ask_login(p, steps);
    CHECK(a);
    CHECK_EQ(a->homeserver, "http://localhost:8008");
    CHECK_EQ(a->device_name, "PHONE");
    CHECK_EQ(a->display_name, "Bob's phone");
    CHECK_EQ(p.asked[4].first, "Display name (default: alice@PHONE): ");
  }

  // Bad answers are asked again.
  {
    ScriptedPrompter p{{"ftp://nope", "bad host name", "example.org", "", "carol",
                        "", "pw", "", ""}};
    auto const       a = ask_login(p, steps);
    CHECK(a);
    CHECK_EQ(a->homeserver, "https://example.org");
    CHECK_EQ(a->user, "carol");
    CHECK_EQ(p.asked.size(), 9u);
    CHECK_EQ(p.asked[3].first, "User: ");
    CHECK_EQ(p.asked[4].first, "User: ");
    CHECK_EQ(p.asked[6].first, "Password: ");
  }

  // End of input at any point abandons setup.
  {
    ScriptedPrompter p{{"", "alice"}};
    CHECK(!ask_login(p, steps));
    CHECK_EQ(p.asked.size(), 3u);
  }

  // The terminal prompter writes prompts and reads lines.
  {
    std::istringstream in{"first\r\nsecret\n"};
    std::ostringstream out;
    TerminalPrompter   t{in, out, -1};
    CHECK_EQ(*t.ask("Q1: ", false), "first");
    CHECK_EQ(*t.ask("Q2: ", true), "secret");
    CHECK(!t.ask("Q3: ", false));
    t.tell("done");
    CHECK_EQ(out.str(), "Q1: Q2: \nQ3: done\n");
  }
}
