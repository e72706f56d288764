#include <jv/json.h>
#include <jv/errors.h>
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <sstream>
#include <vector>

namespace jv {

namespace {
    struct Parser {
        std::string_view s;
        size_t i = 0;
        size_t line = 1;
        size_t col = 1;

        struct Opener { char ch; size_t line, col; };
        std::vector<Opener> opener_stack;

        explicit Parser(std::string_view str) : s(str) {}

        bool at_end() const { return i >= s.size(); }
        char peek() const { return i < s.size() ? s[i] : '\0'; }

        char get() {
            if (i >= s.size()) return '\0';
            char c = s[i++];
            if (c == '\n') { ++line; col = 1; }
            else ++col;
            return c;
        }

        void advance(size_t n) {
            // literals never contain a newline
            i += n;
            col += n;
        }

        void push_opener(char ch) {
            if (opener_stack.size() >= kMaxDepth)
                fail("maximum nesting depth exceeded");
            opener_stack.push_back(Opener{ch, line, col});
        }
        void pop_opener() {
            if (opener_stack.empty()) return;
            opener_stack.pop_back();
        }

        // Bytes of context shown on each side of the error column.
        static constexpr size_t kExcerptRadius = 40;

        std::string format_error(const std::string& base, size_t err_line, size_t err_col) const {
            // find start of error line
            size_t pos = 0;
            size_t cur = 1;
            while (cur < err_line and pos < s.size()) {
                if (s[pos] == '\n') ++cur;
                ++pos;
            }
            size_t line_start = pos;
            size_t line_end = pos;
            while (line_end < s.size() and s[line_end] != '\n') ++line_end;
            size_t line_len = line_end - line_start;

            size_t caret_pos = err_col > 0 ? err_col - 1 : 0;
            if (caret_pos > line_len) caret_pos = line_len;

            // window of the line around the caret, "..." where it is cut
            size_t from = caret_pos > kExcerptRadius ? caret_pos - kExcerptRadius : 0;
            size_t to = std::min(line_len, caret_pos + kExcerptRadius);
            std::string excerpt = from > 0 ? "..." : "";
            std::string caret(excerpt.size() + caret_pos - from, ' ');
            caret.push_back('^');
            excerpt += std::string(s.substr(line_start + from, to - from));
            if (to < line_len) excerpt += "...";

            std::ostringstream ss;
            ss << base << " (line " << err_line << ", column " << err_col << ")" << "\n";
            ss << excerpt << "\n" << caret;
            if (not opener_stack.empty()) {
                auto o = opener_stack.back();
                ss << "\n(opened at line " << o.line << ", column " << o.col << ")";
            }
            return ss.str();
        }

        [[noreturn]] void fail(const std::string& base) const {
            throw ParseError(format_error(base, line, col), line, col);
        }

        void skip_ws() {
            while (i < s.size() and is_json_space(s[i])) get();
        }

        Value parse_value() {
            skip_ws();
            if (at_end()) fail("unexpected end of input while parsing value");
            char c = peek();
            if (c == '"') return parse_string();
            if (c == '[') return parse_array();
            if (c == '{') return parse_object();

            LiteralToken tk = scan_literal(s, i);
            switch (tk.kind) {
                case LiteralKind::Null: advance(tk.length); return Value();
                case LiteralKind::True: advance(tk.length); return Value(true);
                case LiteralKind::False: advance(tk.length); return Value(false);
                case LiteralKind::Number: {
                    Number n{std::string(s.substr(i, tk.length))};
                    advance(tk.length);
                    return Value(std::move(n));
                }
                case LiteralKind::None:
                    break;
            }

            if (c == '-' or std::isdigit(static_cast<unsigned char>(c))) fail("invalid number");
            // Friendly suggestions for Python-style True/False/None
            if (std::isalpha(static_cast<unsigned char>(c))) {
                size_t j = i;
                while (j < s.size() and (std::isalnum(static_cast<unsigned char>(s[j])) or s[j] == '_')) ++j;
                std::string token(s.substr(i, j - i));
                if (token == "True" or token == "False") {
                    std::string sug = (token == "True") ? "true" : "false";
                    fail("unexpected token while parsing value; did you mean '" + sug + "' (lowercase)?");
                }
                if (token == "None") fail("unexpected token while parsing value; did you mean 'null'?");
                if (token.rfind("null", 0) == 0 or token.rfind("true", 0) == 0 or token.rfind("false", 0) == 0)
                    fail("invalid literal");
            }
            fail("unexpected token while parsing value");
        }

        static int hex_val(char c) {
            if ('0' <= c and c <= '9') return c - '0';
            if ('a' <= c and c <= 'f') return 10 + (c - 'a');
            if ('A' <= c and c <= 'F') return 10 + (c - 'A');
            return -1;
        }

        // encode a Unicode code point as UTF-8 into out
        static void encode_utf8(uint32_t cp, std::string& out) {
            if (cp <= 0x7F) out.push_back(static_cast<char>(cp));
            else if (cp <= 0x7FF) {
                out.push_back(static_cast<char>(0xC0 | ((cp >> 6) & 0x1F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            }
            else if (cp <= 0xFFFF) {
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
                if (at_end()) fail("unterminated unicode escape");
                int hv = hex_val(get());
                if (hv < 0) fail("invalid unicode escape");
                v = (v << 4) | static_cast<uint32_t>(hv);
            }
            return v;
        }

        // \u escape; a lone surrogate decodes to U+FFFD
        uint32_t parse_unicode_escape() {
            uint32_t cp = parse_hex4();
            if (cp < 0xD800 or cp > 0xDFFF) return cp;
            if (cp >= 0xDC00) return 0xFFFD;
            if (s.compare(i, 2, "\\u") != 0) return 0xFFFD;
            size_t save_i = i, save_col = col;
            advance(2);
            uint32_t lo = parse_hex4();
            if (lo < 0xDC00 or lo > 0xDFFF) {
                i = save_i;
                col = save_col;
                return 0xFFFD;
            }
            return 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
        }

        Value parse_string() {
            if (get() != '"') fail("expected '\"'");
            std::string out;
            while (true) {
                if (at_end()) fail("unexpected end in string");
                char c = get();
                if (c == '"') break;
                if (static_cast<unsigned char>(c) < 0x20) fail("invalid control character in string");
                if (c == '\\') {
                    if (at_end()) fail("unexpected end in string escape");
                    char e = get();
                    switch (e) {
                        case '"': out.push_back('"'); break;
                        case '\\': out.push_back('\\'); break;
                        case '/': out.push_back('/'); break;
                        case 'b': out.push_back('\b'); break;
                        case 'f': out.push_back('\f'); break;
                        case 'n': out.push_back('\n'); break;
                        case 'r': out.push_back('\r'); break;
                        case 't': out.push_back('\t'); break;
                        case 'u': encode_utf8(parse_unicode_escape(), out); break;
                        default:
                            fail("unsupported escape sequence");
                    }
                } else {
                    out.push_back(c);
                }
            }
            return Value(std::move(out));
        }

        Value parse_array() {
            push_opener('[');
            get();
            Value::list_t out_values;
            skip_ws();
            if (peek() == ']') { get(); pop_opener(); return Value(std::move(out_values)); }
            while (true) {
                out_values.emplace_back(parse_value());
                skip_ws();
                if (at_end()) fail("unexpected end of input; expected ',' or ']'");
                char c = peek();
                if (c == ']') { get(); pop_opener(); break; }
                if (c == ',') { get(); continue; }
                if (c == ':') fail("unexpected ':' after value; found key/value pair inside array");
                fail("expected ',' or ']'");
            }
            return Value(std::move(out_values));
        }

        Value parse_object() {
            push_opener('{');
            get();
            Dictionary d;
            skip_ws();
            if (peek() == '}') { get(); pop_opener(); return Value(std::move(d)); }
            while (true) {
                skip_ws();
                if (peek() != '"') {
                    // read an identifier to provide a helpful suggestion
                    size_t j = i;
                    while (j < s.size() and (std::isalnum(static_cast<unsigned char>(s[j])) or s[j] == '_')) ++j;
                    std::string base = "expected string key";
                    if (j > i) base += "; are you missing quotes around '" + std::string(s.substr(i, j - i)) + "'?";
                    fail(base);
                }
                Value k = parse_string();
                skip_ws();
                if (get() != ':') fail("expected ':' after object key");
                Value v = parse_value();
                d[k.as_string()] = std::move(v);
                skip_ws();
                if (at_end()) fail("unexpected end of input; expected ',' or '}'");
                char c = peek();
                if (c == '}') { get(); pop_opener(); break; }
                if (c == ',') { get(); continue; }
                fail("expected ',' or '}'");
            }
            return Value(std::move(d));
        }
    };
}

Value parse_json(std::string_view text) {
    Parser p(text);
    Value val = p.parse_value();
    p.skip_ws();
    if (not p.at_end()) p.fail("extra data after JSON value");
    return val;
}

} // namespace jv
