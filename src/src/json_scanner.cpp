#include <jv/json.h>

namespace jv {

namespace {
    bool is_digit(char c) { return c >= '0' && c <= '9'; }

    bool is_boundary(std::string_view s, size_t pos) {
        if (pos >= s.size()) return true;
        char c = s[pos];
        return is_json_space(c) || c == ',' || c == ']' || c == '}' || c == ':';
    }

    // Length of the JSON number at pos, or 0 when the grammar is not matched:
    //   -? (0 | [1-9][0-9]*) (\.[0-9]+)? ([eE][+-]?[0-9]+)?
    size_t scan_number(std::string_view s, size_t pos) {
        size_t j = pos;
        if (j < s.size() && s[j] == '-') ++j;
        if (j >= s.size() || !is_digit(s[j])) return 0;
        if (s[j] == '0') {
            ++j;
        } else {
            while (j < s.size() && is_digit(s[j])) ++j;
        }
        if (j < s.size() && s[j] == '.') {
            ++j;
            if (j >= s.size() || !is_digit(s[j])) return 0;
            while (j < s.size() && is_digit(s[j])) ++j;
        }
        if (j < s.size() && (s[j] == 'e' || s[j] == 'E')) {
            ++j;
            if (j < s.size() && (s[j] == '+' || s[j] == '-')) ++j;
            if (j >= s.size() || !is_digit(s[j])) return 0;
            while (j < s.size() && is_digit(s[j])) ++j;
        }
        return j - pos;
    }

    LiteralToken keyword(std::string_view s, size_t pos, std::string_view word, LiteralKind kind) {
        if (s.compare(pos, word.size(), word) != 0) return {};
        if (!is_boundary(s, pos + word.size())) return {};
        return LiteralToken{kind, word.size()};
    }
}

LiteralToken scan_literal(std::string_view text, size_t pos) noexcept {
    if (pos >= text.size()) return {};
    switch (text[pos]) {
        case 'n': return keyword(text, pos, "null", LiteralKind::Null);
        case 't': return keyword(text, pos, "true", LiteralKind::True);
        case 'f': return keyword(text, pos, "false", LiteralKind::False);
        default: break;
    }
    size_t len = scan_number(text, pos);
    if (len == 0 || !is_boundary(text, pos + len)) return {};
    return LiteralToken{LiteralKind::Number, len};
}

} // namespace jv
