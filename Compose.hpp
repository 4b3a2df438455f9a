#ifndef COMPOSE_DOT_HPP
#define COMPOSE_DOT_HPP

#include <optional>
#include <string>
#include <string_view>

// What gets sent: one message, the same for every recipient.
struct Message {
  std::optional<std::string> subject;
  std::string                body; // escapes already stripped

  // The event body: subject, blank line, body; or just the body.
  std::string text() const;
};

// Drop every line starting with '~'.
std::string strip_escapes(std::string_view raw);

// Build the message from what was read on stdin and the -s subject; an
// empty subject is no subject.  Throws std::invalid_argument unless both
// are valid UTF-8.
Message compose(std::string_view raw, std::optional<std::string> subject);

bool is_utf8(std::string_view s);

#endif // COMPOSE_DOT_HPP
