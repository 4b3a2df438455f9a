#ifndef MATRIX_JSON_DOT_HPP
#define MATRIX_JSON_DOT_HPP

#include <string>
#include <string_view>

#include <json/json.h>

namespace Matrix {

// Sorted keys, no insignificant whitespace, UTF-8 left unescaped.  This
// is the form that gets signed.
std::string canonical_json(Json::Value const& v);

// Throws std::invalid_argument on malformed input.
Json::Value parse_json(std::string_view text);

} // namespace Matrix

#endif // MATRIX_JSON_DOT_HPP
