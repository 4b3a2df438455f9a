#ifndef BASE64_DOT_HPP
#define BASE64_DOT_HPP

#include <string>
#include <string_view>

// Matrix uses the standard alphabet without '=' padding.  The decoder
// takes input either way; anything outside the alphabet throws
// std::invalid_argument.

namespace Base64 {
std::string enc(std::string_view in);
std::string dec(std::string_view in);
} // namespace Base64

#endif // BASE64_DOT_HPP
