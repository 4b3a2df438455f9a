#include "Login.hpp"

#include <stdexcept>

#include <fmt/format.h>

#include <glog/logging.h>

#include "POSIX.hpp"
#include "Url.hpp"

TerminalPrompter::TerminalPrompter(std::istream& in,
                                   std::ostream& out,
                                   int           in_fd)
  : in_(in)
  , out_(out)
  , in_fd_(in_fd)
{
}

std::optional<std::string> TerminalPrompter::ask(std::string const& prompt,
                                                 bool               secret)
{
  out_ << prompt << std::flush;

  std::string answer;
  bool        got;
  if (secret) {
    POSIX::no_echo quiet(in_fd_);
    got = static_cast<bool>(std::getline(in_, answer));
    out_ << '\n' << std::flush;
  }
  else {
    got = static_cast<bool>(std::getline(in_, answer));
  }

  if (!got)
    return {};
  if (!answer.empty() && answer.back() == '\r')
    answer.pop_back();
  return answer;
}

void TerminalPrompter::tell(std::string const& line)
{
  out_ << line << '\n' << std::flush;
}

std::vector<LoginStep> login_steps(std::string const& hostname,
                                   std::string const& login_name)
{
  std::vector<LoginStep> steps;

  steps.push_back(LoginStep{
      [](LoginAnswers const&) {
        return fmt::format("Homeserver (default: {}): ",
                           Config::default_homeserver);
      },
      false,
      [](LoginAnswers& a, std::string const& answer) {
        auto const url = Url::normalize(
            answer.empty() ? Config::default_homeserver : answer);
        try {
          a.homeserver = Url{url}.as_string();
        }
        catch (std::invalid_argument const& e) {
          LOG(WARNING) << e.what();
          return false;
        }
        return true;
      }});

  steps.push_back(LoginStep{
      [](LoginAnswers const&) { return std::string("User: "); }, false,
      [](LoginAnswers& a, std::string const& answer) {
        a.user = answer;
        return !answer.empty();
      }});

  steps.push_back(LoginStep{
      [](LoginAnswers const&) { return std::string("Password: "); }, true,
      [](LoginAnswers& a, std::string const& answer) {
        a.password = answer;
        return !answer.empty();
      }});

  steps.push_back(LoginStep{
      [hostname](LoginAnswers const&) {
        return fmt::format("Device name (default: {}): ", hostname);
      },
      false,
      [hostname](LoginAnswers& a, std::string const& answer) {
        a.device_name = answer.empty() ? hostname : answer;
        return !a.device_name.empty();
      }});

  steps.push_back(LoginStep{
      [login_name](LoginAnswers const& a) {
        return fmt::format("Display name (default: {}@{}): ", login_name,
                           a.device_name);
      },
      false,
      [login_name](LoginAnswers& a, std::string const& answer) {
        a.display_name = answer.empty()
                             ? fmt::format("{}@{}", login_name, a.device_name)
                             : answer;
        return true;
      }});

  return steps;
}

std::optional<LoginAnswers> ask_login(Prompter&                     prompter,
                                      std::vector<LoginStep> const& steps)
{
  LoginAnswers answers;
  for (auto const& step : steps) {
    for (;;) {
      auto const answer = prompter.ask(step.prompt(answers), step.secret);
      if (!answer) {
        LOG(WARNING) << "input ended during setup";
        return {};
      }
      if (step.accept(answers, *answer))
        break;
    }
  }
  return answers;
}
