// jv::Value - the generic JSON tree handed to decode targets
#pragma once

#include <jv/errors.h>
#include <cstdint>
#include <initializer_list>
#include <map>
#include <memory>
#include <ostream>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace jv {

struct Dictionary; // forward

// A JSON number kept as its literal text. Conversion to a machine type
// happens on request and throws NumberError when the literal does not fit.
struct Number {
    std::string literal = "0";

    Number() = default;
    explicit Number(std::string lit) : literal(std::move(lit)) {}

    int64_t as_int() const;
    uint64_t as_uint() const;
    double as_double() const;

    // true when the literal has a fraction or an exponent
    bool is_fractional() const noexcept;

    bool operator==(const Number& o) const noexcept { return literal == o.literal; }
    bool operator!=(const Number& o) const noexcept { return !(*this == o); }
};

struct Value {
    using list_t = std::vector<Value>;
    using dict_ptr = std::shared_ptr<Dictionary>;
    using key_type = std::string;

    std::variant<std::monostate, bool, Number, std::string, list_t, dict_ptr> v;

    Value() = default;
    Value(bool b) : v(b) {}
    Value(int x) : v(Number(std::to_string(x))) {}
    Value(int64_t x) : v(Number(std::to_string(x))) {}
    Value(uint64_t x) : v(Number(std::to_string(x))) {}
    Value(double x);
    Value(Number n) : v(std::move(n)) {}
    Value(const char* s) : v(std::string(s)) {}
    Value(const std::string& s) : v(s) {}
    Value(std::string&& s) : v(std::move(s)) {}
    Value(const list_t& l) : v(l) {}
    Value(list_t&& l) : v(std::move(l)) {}
    Value(const Dictionary& d);
    Value(Dictionary&& d);

    bool is_null() const noexcept { return std::holds_alternative<std::monostate>(v); }
    bool is_bool() const noexcept { return std::holds_alternative<bool>(v); }
    bool is_number() const noexcept { return std::holds_alternative<Number>(v); }
    bool is_string() const noexcept { return std::holds_alternative<std::string>(v); }
    bool is_list() const noexcept { return std::holds_alternative<list_t>(v); }
    bool is_dict() const noexcept { return std::holds_alternative<dict_ptr>(v); }

    // These throw TypeError when the value holds another kind.
    bool as_bool() const;
    const Number& as_number() const;
    const std::string& as_string() const;
    const list_t& as_list() const;
    const Dictionary& as_dict() const;

    // indexing and access; throw KeyError / IndexError on a missing element
    const Value& at(size_t idx) const;
    const Value& at(const key_type& k) const;
    bool has(const key_type& k) const;
    size_t size() const noexcept;

    // "null", "boolean", "number", "string", "array" or "object"
    const char* kind_name() const noexcept;

    std::string dump() const;
    std::string dump(int indent) const;

    bool operator==(const Value& o) const;
    bool operator!=(const Value& o) const { return !(*this == o); }
};

struct Dictionary {
    using key_type = std::string;
    using value_type = Value;
    using map_type = std::map<key_type, value_type>;

    map_type data;

    Dictionary() = default;
    Dictionary(std::initializer_list<std::pair<const key_type, value_type>> init)
      : data(init) {}

    value_type& operator[](const key_type& k) { return data[k]; }

    const value_type& at(const key_type& k) const {
        auto it = data.find(k);
        if (it == data.end()) throw KeyError(k);
        return it->second;
    }

    bool has(const key_type& key) const noexcept { return data.find(key) != data.end(); }
    size_t size() const noexcept { return data.size(); }
    bool empty() const noexcept { return data.empty(); }

    std::vector<key_type> keys() const {
        std::vector<key_type> out;
        out.reserve(data.size());
        for (auto const &p: data) out.push_back(p.first);
        return out;
    }

    bool operator==(const Dictionary& rhs) const { return data == rhs.data; }
    bool operator!=(const Dictionary& rhs) const { return !(*this == rhs); }

    std::string dump() const;
    std::string dump(int indent) const;
};

inline Value::Value(const Dictionary& d) : v(std::make_shared<Dictionary>(d)) {}
inline Value::Value(Dictionary&& d) : v(std::make_shared<Dictionary>(std::move(d))) {}

inline std::ostream& operator<<(std::ostream& os, const Value& v) {
    os << v.dump();
    return os;
}

inline std::ostream& operator<<(std::ostream& os, const Dictionary& d) {
    os << d.dump();
    return os;
}

} // namespace jv
