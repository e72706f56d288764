#pragma once

#include <jv/errors.h>
#include <jv/value.h>
#include <cstdint>
#include <functional>
#include <limits>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace jv {

// Something a parsed JSON value can be decoded into, and encoded back from.
class Decodable {
  public:
    virtual ~Decodable() = default;

    virtual void from_json(const Value& value) = 0;
    virtual Value to_json() const = 0;
};

// Produces a fresh decode target. Returning nullptr means "no target".
using Factory = std::function<std::shared_ptr<Decodable>()>;

// Conversion hooks for standard types. Caller types provide their own
// from_json(const Value&, T&) and to_json(const T&) found by ADL.
inline void from_json(const Value& v, bool& out) { out = v.as_bool(); }
inline void from_json(const Value& v, int64_t& out) { out = v.as_number().as_int(); }
inline void from_json(const Value& v, uint64_t& out) { out = v.as_number().as_uint(); }
inline void from_json(const Value& v, double& out) { out = v.as_number().as_double(); }
inline void from_json(const Value& v, std::string& out) { out = v.as_string(); }
inline void from_json(const Value& v, Value& out) { out = v; }
inline void from_json(const Value& v, Dictionary& out) { out = v.as_dict(); }
inline void from_json(const Value& v, Value::list_t& out) { out = v.as_list(); }

inline void from_json(const Value& v, int& out) {
    int64_t n = v.as_number().as_int();
    if (n < std::numeric_limits<int>::min() or n > std::numeric_limits<int>::max())
        throw NumberError(v.as_number().literal, "int");
    out = static_cast<int>(n);
}

template <typename T>
void from_json(const Value& v, std::vector<T>& out) {
    std::vector<T> tmp;
    tmp.reserve(v.as_list().size());
    for (auto const &e: v.as_list()) {
        T x{};
        from_json(e, x);
        tmp.push_back(std::move(x));
    }
    out = std::move(tmp);
}

inline Value to_json(bool b) { return Value(b); }
inline Value to_json(int n) { return Value(n); }
inline Value to_json(int64_t n) { return Value(n); }
inline Value to_json(uint64_t n) { return Value(n); }
inline Value to_json(double x) { return Value(x); }
inline Value to_json(const char* s) { return Value(s); }
inline Value to_json(const std::string& s) { return Value(s); }
inline Value to_json(const Value& v) { return v; }
inline Value to_json(const Dictionary& d) { return Value(d); }
inline Value to_json(const Value::list_t& l) { return Value(l); }

template <typename T>
Value to_json(const std::vector<T>& in) {
    Value::list_t out;
    out.reserve(in.size());
    for (auto const &e: in) out.push_back(to_json(e));
    return Value(std::move(out));
}

namespace detail {
    // Called from outside Decodable so that the member from_json/to_json
    // names do not hide the free hooks.
    template <typename T>
    void decode_into(const Value& v, T& out) { from_json(v, out); }

    template <typename T>
    Value encode_from(const T& in) { return to_json(in); }
}

// Decode target holding a T, converted with the from_json/to_json hooks.
template <typename T>
class Typed : public Decodable {
  public:
    Typed() = default;
    explicit Typed(T value) : value_(std::move(value)) {}

    void from_json(const Value& value) override {
        T tmp{};
        detail::decode_into(value, tmp);
        value_ = std::move(tmp);
    }

    Value to_json() const override { return detail::encode_from(value_); }

    T& get() noexcept { return value_; }
    const T& get() const noexcept { return value_; }

  private:
    T value_{};
};

template <typename T>
Factory make_factory() {
    return [] { return std::make_shared<Typed<T>>(); };
}

// Default targets: a Dictionary for objects, a Value::list_t for arrays.
inline Factory default_object_factory() { return make_factory<Dictionary>(); }
inline Factory default_array_factory() { return make_factory<Value::list_t>(); }

}  // namespace jv
