#pragma once

#include <jv/value.h>
#include <cstddef>
#include <string>
#include <string_view>

namespace jv {

// Maximum nesting of arrays and objects accepted by parse_json.
constexpr size_t kMaxDepth = 512;

// Parse a complete JSON text (RFC 8259, no extensions). Throws ParseError on
// malformed input, including trailing data after the value.
Value parse_json(std::string_view text);

enum class LiteralKind { None, Null, True, False, Number };

struct LiteralToken {
    LiteralKind kind = LiteralKind::None;
    size_t length = 0;
};

// Recognize the scalar literal starting at `pos` without converting it.
// The literal must be followed by the end of input, whitespace or one of
// , ] } :  otherwise the result kind is None.
LiteralToken scan_literal(std::string_view text, size_t pos = 0) noexcept;

// JSON whitespace: space, tab, line feed, carriage return.
inline bool is_json_space(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

namespace json_literals {
    inline Value operator"" _json(const char* s, std::size_t len) {
        return parse_json(std::string_view(s, len));
    }
}

}  // namespace jv
