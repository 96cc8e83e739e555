#pragma once

#include <ig/dictionary.h>
#include <stdexcept>
#include <string>

namespace ig {

// Thrown by parse_json. what() already contains the line/column and an
// excerpt of the offending line with a caret under the error position.
struct JsonParseError : public std::runtime_error {
    size_t line, col;
    JsonParseError(const std::string& msg, size_t l, size_t c) : std::runtime_error(msg), line(l), col(c) {}
};

// Parse JSON text (comments allowed) into a Dictionary. Object keys keep
// their document order. Throws JsonParseError.
Dictionary parse_json(const std::string& text);

namespace json_literals {
    inline Dictionary operator"" _json(const char* s, std::size_t len) { return parse_json(std::string(s, len)); }
}  // namespace json_literals

}  // namespace ig
