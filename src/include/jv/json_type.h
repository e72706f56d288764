#pragma once

#include <jv/value.h>
#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>

namespace jv {

// The six JSON data types. Invalid is a control value for uninitialized
// and error states and never appears on the wire.
enum class JsonType {
    Invalid,
    Object,
    Array,
    Null,
    String,
    Number,
    Boolean
};

constexpr size_t kJsonTypeCount = 7;

const char* to_string(JsonType t) noexcept;

inline std::ostream& operator<<(std::ostream& os, JsonType t) {
    os << to_string(t);
    return os;
}

// Classify a JSON text by its outer type without decoding it.
//
// Objects, arrays and strings are recognized from their first significant
// byte only; the rest of the text is not validated here and any error in it
// surfaces when the text is decoded. Scalars must start with a complete
// null/true/false literal or a JSON number.
//
// Throws EmptyInput for an empty (or whitespace only) text and UnknownType
// when no JSON value starts the text.
JsonType type_of(std::string_view json);

inline JsonType type_of(const char* json) { return type_of(std::string_view(json)); }
inline JsonType type_of(const std::string& json) { return type_of(std::string_view(json)); }

// Type of an already parsed value.
JsonType type_of(const Value& value) noexcept;

}  // namespace jv
