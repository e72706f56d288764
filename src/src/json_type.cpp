#include <jv/json_type.h>
#include <jv/errors.h>
#include <jv/json.h>

namespace jv {

const char* to_string(JsonType t) noexcept {
    switch (t) {
        case JsonType::Object: return "object";
        case JsonType::Array: return "array";
        case JsonType::Null: return "null";
        case JsonType::String: return "string";
        case JsonType::Number: return "number";
        case JsonType::Boolean: return "boolean";
        case JsonType::Invalid: break;
    }
    return "invalid";
}

JsonType type_of(std::string_view json) {
    size_t start = 0;
    while (start < json.size() && is_json_space(json[start])) ++start;
    if (start >= json.size()) throw EmptyInput();

    switch (json[start]) {
        case '{': return JsonType::Object;
        case '[': return JsonType::Array;
        case '"': return JsonType::String;
        default: break;
    }

    switch (scan_literal(json, start).kind) {
        case LiteralKind::Null: return JsonType::Null;
        case LiteralKind::True:
        case LiteralKind::False: return JsonType::Boolean;
        case LiteralKind::Number: return JsonType::Number;
        case LiteralKind::None: break;
    }
    throw UnknownType();
}

JsonType type_of(const Value& value) noexcept {
    if (value.is_dict()) return JsonType::Object;
    if (value.is_list()) return JsonType::Array;
    if (value.is_string()) return JsonType::String;
    if (value.is_number()) return JsonType::Number;
    if (value.is_bool()) return JsonType::Boolean;
    return JsonType::Null;
}

}  // namespace jv
