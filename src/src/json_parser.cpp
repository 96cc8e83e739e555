#include <ig/json.h>
#include <cctype>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <sstream>
#include <string>
#include <vector>

namespace ig {

namespace {
    struct Parser {
        const std::string& s;
        size_t i = 0;
        size_t line = 1;
        size_t col = 1;

        struct Opener {
            char ch;
            size_t line, col;
        };
        std::vector<Opener> opener_stack;

        explicit Parser(const std::string& str) : s(str) {}

        char peek() const { return i < s.size() ? s[i] : '\0'; }
        bool at_end() const { return i >= s.size(); }

        char get() {
            if (i >= s.size()) return '\0';
            char c = s[i++];
            if (c == '\n') {
                ++line;
                col = 1;
            } else
                ++col;
            return c;
        }

        std::string format_error(const std::string& base, size_t err_line, size_t err_col) const {
            // find start of error line
            size_t pos = 0;
            size_t cur = 1;
            while (cur < err_line and pos < s.size()) {
                if (s[pos] == '\n') ++cur;
                ++pos;
            }
            size_t line_end = pos;
            while (line_end < s.size() and s[line_end] != '\n') ++line_end;
            std::string line_text = s.substr(pos, line_end - pos);
            size_t caret_pos = err_col > 0 ? err_col - 1 : 0;
            if (caret_pos > line_text.size()) caret_pos = line_text.size();
            std::string caret(caret_pos, ' ');
            caret.push_back('^');

            std::ostringstream ss;
            ss << base << " (line " << err_line << ", column " << err_col << ")"
               << "\n";
            ss << line_text << "\n" << caret;
            if (not opener_stack.empty()) {
                auto o = opener_stack.back();
                ss << "\n('" << o.ch << "' opened at line " << o.line << ", column " << o.col << ")";
            }
            return ss.str();
        }

        [[noreturn]] void fail(const std::string& base) const {
            throw JsonParseError(format_error(base, line, col), line, col);
        }

        void skip_ws() {
            while (i < s.size()) {
                unsigned char c = static_cast<unsigned char>(s[i]);
                if (std::isspace(c)) {
                    get();
                    continue;
                }

                // line comment //...
                if (c == '/' and i + 1 < s.size() and s[i + 1] == '/') {
                    get();
                    get();
                    while (i < s.size() and peek() != '\n') get();
                    continue;
                }

                // block comment /* ... */
                if (c == '/' and i + 1 < s.size() and s[i + 1] == '*') {
                    size_t l = line, cl = col;
                    get();
                    get();
                    bool closed = false;
                    while (i < s.size()) {
                        char a = get();
                        if (a == '*' and peek() == '/') {
                            get();
                            closed = true;
                            break;
                        }
                    }
                    if (not closed) throw JsonParseError(format_error("unterminated block comment", l, cl), l, cl);
                    continue;
                }

                break;
            }
        }

        Dictionary parse_value() {
            skip_ws();
            char c = peek();
            if (c == 'n') return parse_literal("null", Dictionary::null());
            if (c == 't') return parse_literal("true", Dictionary(true));
            if (c == 'f') return parse_literal("false", Dictionary(false));
            if (c == '"') return Dictionary(parse_string());
            if (c == '[') return parse_array();
            if (c == '{') return parse_object();
            if (c == '-' or std::isdigit(static_cast<unsigned char>(c))) return parse_number();
            if (c == '\0') fail("unexpected end of input while parsing value");
            // Python-style True/False/None are a common mistake in hand-written records
            if (std::isalpha(static_cast<unsigned char>(c))) {
                size_t j = i;
                while (j < s.size() and (std::isalnum(static_cast<unsigned char>(s[j])) or s[j] == '_')) ++j;
                std::string token = s.substr(i, j - i);
                if (token == "True" or token == "False" or token == "None") {
                    std::string sug = token == "True" ? "true" : token == "False" ? "false" : "null";
                    fail("unexpected token '" + token + "' while parsing value; did you mean '" + sug + "'?");
                }
            }
            fail("unexpected token while parsing value");
        }

        Dictionary parse_literal(const char* word, Dictionary value) {
            std::string w(word);
            if (s.compare(i, w.size(), w) == 0) {
                i += w.size();
                col += w.size();
                return value;
            }
            fail("invalid literal");
        }

        static int hex_val(char c) {
            if ('0' <= c and c <= '9') return c - '0';
            if ('a' <= c and c <= 'f') return 10 + (c - 'a');
            if ('A' <= c and c <= 'F') return 10 + (c - 'A');
            return -1;
        }

        static void encode_utf8(uint32_t cp, std::string& out) {
            if (cp <= 0x7F)
                out.push_back(static_cast<char>(cp));
            else if (cp <= 0x7FF) {
                out.push_back(static_cast<char>(0xC0 | ((cp >> 6) & 0x1F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else if (cp <= 0xFFFF) {
                out.push_back(static_cast<char>(0xE0 | ((cp >> 12) & 0x0F)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else {
                out.push_back(static_cast<char>(0xF0 | ((cp >> 18) & 0x07)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            }
        }

        uint32_t parse_hex4() {
            uint32_t v = 0;
            for (int k = 0; k < 4; ++k) {
                char h = get();
                if (h == '\0') fail("unterminated unicode escape");
                int hv = hex_val(h);
                if (hv < 0) fail("invalid unicode escape");
                v = (v << 4) | static_cast<uint32_t>(hv);
            }
            return v;
        }

        std::string parse_string() {
            size_t start_line = line, start_col = col;
            get();  // opening quote
            std::string out;
            while (true) {
                if (at_end()) {
                    throw JsonParseError(format_error("unterminated string", start_line, start_col), start_line,
                                         start_col);
                }
                char c = get();
                if (c == '"') break;
                if (c == '\n') fail("newline inside string");
                if (c == '\\') {
                    char e = get();
                    switch (e) {
                        case '"':
                            out.push_back('"');
                            break;
                        case '\\':
                            out.push_back('\\');
                            break;
                        case '/':
                            out.push_back('/');
                            break;
                        case 'b':
                            out.push_back('\b');
                            break;
                        case 'f':
                            out.push_back('\f');
                            break;
                        case 'n':
                            out.push_back('\n');
                            break;
                        case 'r':
                            out.push_back('\r');
                            break;
                        case 't':
                            out.push_back('\t');
                            break;
                        case 'u': {
                            uint32_t cp = parse_hex4();
                            // combine surrogate pairs
                            if (cp >= 0xD800 and cp <= 0xDBFF and peek() == '\\' and i + 1 < s.size() and
                                s[i + 1] == 'u') {
                                get();
                                get();
                                uint32_t lo = parse_hex4();
                                if (lo >= 0xDC00 and lo <= 0xDFFF) {
                                    cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
                                } else {
                                    encode_utf8(cp, out);
                                    cp = lo;
                                }
                            }
                            encode_utf8(cp, out);
                            break;
                        }
                        case '\0':
                            fail("unexpected end in string escape");
                        default:
                            fail(std::string("unsupported escape sequence '\\") + e + "'");
                    }
                } else {
                    out.push_back(c);
                }
            }
            return out;
        }

        Dictionary parse_number() {
            size_t start = i;
            size_t start_col = col;
            if (peek() == '-') get();
            if (not std::isdigit(static_cast<unsigned char>(peek()))) fail("invalid number");
            while (std::isdigit(static_cast<unsigned char>(peek()))) get();
            bool is_float = false;
            if (peek() == '.') {
                is_float = true;
                get();
                if (not std::isdigit(static_cast<unsigned char>(peek()))) fail("invalid number");
                while (std::isdigit(static_cast<unsigned char>(peek()))) get();
            }
            if (peek() == 'e' or peek() == 'E') {
                is_float = true;
                get();
                if (peek() == '+' or peek() == '-') get();
                if (not std::isdigit(static_cast<unsigned char>(peek()))) fail("invalid number");
                while (std::isdigit(static_cast<unsigned char>(peek()))) get();
            }
            std::string token = s.substr(start, i - start);
            errno = 0;
            if (not is_float) {
                long long v = std::strtoll(token.c_str(), nullptr, 10);
                if (errno != ERANGE) return Dictionary(static_cast<int64_t>(v));
                // out of int64 range: keep the magnitude as a double
                errno = 0;
            }
            double d = std::strtod(token.c_str(), nullptr);
            if (errno == ERANGE and (d > 1.0 or d < -1.0)) {
                throw JsonParseError(format_error("number out of range", line, start_col), line, start_col);
            }
            return Dictionary(d);
        }

        Dictionary parse_array() {
            opener_stack.push_back(Opener{'[', line, col});
            get();
            Dictionary out = Dictionary::array();
            skip_ws();
            if (peek() == ']') {
                get();
                opener_stack.pop_back();
                return out;
            }
            while (true) {
                out.push_back(parse_value());
                skip_ws();
                char c = get();
                if (c == ']') break;
                if (c == ',') continue;
                if (c == ':') fail("unexpected ':' after value; found key/value pair inside array");
                fail("expected ',' or ']'");
            }
            opener_stack.pop_back();
            return out;
        }

        Dictionary parse_object() {
            opener_stack.push_back(Opener{'{', line, col});
            get();
            Dictionary d;
            skip_ws();
            if (peek() == '}') {
                get();
                opener_stack.pop_back();
                return d;
            }
            while (true) {
                skip_ws();
                if (peek() != '"') {
                    // read an identifier to provide a helpful suggestion
                    size_t j = i;
                    while (j < s.size() and (std::isalnum(static_cast<unsigned char>(s[j])) or s[j] == '_')) ++j;
                    std::string base = "expected string key";
                    if (j > i) base += " - are you missing quotes around '" + s.substr(i, j - i) + "'?";
                    fail(base);
                }
                std::string key = parse_string();
                skip_ws();
                if (get() != ':') fail("expected ':' after object key");
                d[key] = parse_value();
                skip_ws();
                char c = get();
                if (c == '}') break;
                if (c == ',') continue;
                fail("expected ',' or '}'");
            }
            opener_stack.pop_back();
            return d;
        }
    };
}  // namespace

Dictionary parse_json(const std::string& text) {
    Parser p(text);
    Dictionary val = p.parse_value();
    p.skip_ws();
    if (not p.at_end()) p.fail("extra data after JSON value");
    return val;
}

}  // namespace ig
