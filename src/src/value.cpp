#include <jv/value.h>
#include <jv/errors.h>
#include <charconv>
#include <cmath>
#include <system_error>

namespace jv {

namespace {
    template <typename T>
    T parse_integer(const std::string& literal, const char* target) {
        T out{};
        const char* first = literal.data();
        const char* last = literal.data() + literal.size();
        auto res = std::from_chars(first, last, out);
        if (res.ec != std::errc() or res.ptr != last) throw NumberError(literal, target);
        return out;
    }

    // shortest text that reads back to the same double
    std::string format_double(double x) {
        if (not std::isfinite(x)) throw Error("unsupported value: non-finite number");
        char buf[64];
        auto res = std::to_chars(buf, buf + sizeof(buf), x);
        return std::string(buf, res.ptr);
    }
}

bool Number::is_fractional() const noexcept {
    return literal.find_first_of(".eE") != std::string::npos;
}

int64_t Number::as_int() const {
    if (is_fractional()) throw NumberError(literal, "int64_t");
    return parse_integer<int64_t>(literal, "int64_t");
}

uint64_t Number::as_uint() const {
    if (is_fractional()) throw NumberError(literal, "uint64_t");
    return parse_integer<uint64_t>(literal, "uint64_t");
}

double Number::as_double() const {
    double d = 0;
    const char* first = literal.data();
    const char* last = literal.data() + literal.size();
    auto res = std::from_chars(first, last, d);
    if (res.ec != std::errc() or res.ptr != last or std::isinf(d)) throw NumberError(literal, "double");
    return d;
}

Value::Value(double x) : v(Number(format_double(x))) {}

bool Value::as_bool() const {
    if (not is_bool()) throw TypeError("boolean", kind_name());
    return std::get<bool>(v);
}

const Number& Value::as_number() const {
    if (not is_number()) throw TypeError("number", kind_name());
    return std::get<Number>(v);
}

const std::string& Value::as_string() const {
    if (not is_string()) throw TypeError("string", kind_name());
    return std::get<std::string>(v);
}

const Value::list_t& Value::as_list() const {
    if (not is_list()) throw TypeError("array", kind_name());
    return std::get<list_t>(v);
}

const Dictionary& Value::as_dict() const {
    if (not is_dict()) throw TypeError("object", kind_name());
    return *std::get<dict_ptr>(v);
}

const Value& Value::at(size_t idx) const {
    const auto &L = as_list();
    if (idx >= L.size()) throw IndexError(idx, L.size());
    return L[idx];
}

const Value& Value::at(const key_type& k) const { return as_dict().at(k); }

bool Value::has(const key_type& k) const { return is_dict() and as_dict().has(k); }

size_t Value::size() const noexcept {
    if (is_list()) return std::get<list_t>(v).size();
    if (is_dict()) return std::get<dict_ptr>(v)->size();
    return 0;
}

const char* Value::kind_name() const noexcept {
    if (is_bool()) return "boolean";
    if (is_number()) return "number";
    if (is_string()) return "string";
    if (is_list()) return "array";
    if (is_dict()) return "object";
    return "null";
}

bool Value::operator==(const Value& o) const {
    if (v.index() != o.v.index()) return false;
    if (is_dict()) return as_dict() == o.as_dict();
    return v == o.v;
}

} // namespace jv
