#ifndef SCRIPTEDPROMPTER_DOT_HPP
#define SCRIPTEDPROMPTER_DOT_HPP

// Answers setup questions from a list, for the tests.

#include <deque>
#include <string>
#include <utility>
#include <vector>

#include "Login.hpp"

class ScriptedPrompter : public Prompter {
public:
  explicit ScriptedPrompter(std::deque<std::string> answers)
    : answers_(std::move(answers))
  {
  }

  std::optional<std::string> ask(std::string const& prompt,
                                 bool               secret) override
  {
    asked.emplace_back(prompt, secret);
    if (answers_.empty())
      return {};
    auto a = answers_.front();
    answers_.pop_front();
    return a;
  }

  void tell(std::string const& line) override { told.push_back(line); }

  std::vector<std::pair<std::string, bool>> asked;
  std::vector<std::string>                  told;

private:
  std::deque<std::string> answers_;
};

#endif // SCRIPTEDPROMPTER_DOT_HPP
