#ifndef LOGIN_DOT_HPP
#define LOGIN_DOT_HPP

#include <functional>
#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace Config {
constexpr auto default_homeserver = "matrix.org";
} // namespace Config

// Asks the user one question at a time.
class Prompter {
public:
  virtual ~Prompter() = default;

  // The answer without its line ending; nullopt at end of input.  A
  // secret answer is read with echo off where that's possible.
  virtual std::optional<std::string> ask(std::string const& prompt,
                                         bool               secret)
      = 0;

  virtual void tell(std::string const& line) = 0;
};

class TerminalPrompter : public Prompter {
public:
  TerminalPrompter(std::istream& in, std::ostream& out, int in_fd);

  std::optional<std::string> ask(std::string const& prompt,
                                 bool               secret) override;

  void tell(std::string const& line) override;

private:
  std::istream& in_;
  std::ostream& out_;
  int           in_fd_;
};

struct LoginAnswers {
  std::string homeserver; // normalized URL
  std::string user;
  std::string password;
  std::string device_name;
  std::string display_name;
};

// One question of the setup dialog: what to ask, and how to check and
// keep the answer.  A rejected answer is asked for again.
struct LoginStep {
  std::function<std::string(LoginAnswers const&)> prompt;

  bool secret{false};

  std::function<bool(LoginAnswers&, std::string const&)> accept;
};

std::vector<LoginStep> login_steps(std::string const& hostname,
                                   std::string const& login_name);

// Run the steps in order; nullopt if input ends first.
std::optional<LoginAnswers> ask_login(Prompter&                     prompter,
                                      std::vector<LoginStep> const& steps);

#endif // LOGIN_DOT_HPP
