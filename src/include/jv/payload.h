#pragma once

#include <jv/errors.h>
#include <jv/json_type.h>
#include <jv/target.h>
#include <jv/value.h>
#include <cstdint>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace jv {

// Which storage slot of a Payload holds the decoded value.
enum class Mapping {
    Invalid,    // nothing decoded, or the last decode failed
    Composite,  // object or array, read with getComposite/getObject/getArray/getAs
    Nil,        // JSON null; check with isNil
    String,     // getString
    Int,        // number decoded with withInt or withNumber; getInt
    Float,      // number decoded with withFloat; getFloat
    Uint,       // number decoded with withUint; getUint
    Bool        // getBool
};

const char* to_string(Mapping m) noexcept;

inline std::ostream& operator<<(std::ostream& os, Mapping m) {
    os << to_string(m);
    return os;
}

// Payload decodes a JSON value whose type is only known at run time.
//
// The accepted JSON types are declared up front with the with* builder
// methods; decode() sniffs the input, rejects types that were not declared
// and decodes the rest into the matching slot. The typed getters require the
// slot they read to be the live one and throw MappingError otherwise.
//
// A Payload is not copyable and must not be used from two threads at once.
class Payload : public Decodable {
  public:
    using Data = std::variant<std::monostate, bool, int64_t, uint64_t, double, std::string,
                              std::shared_ptr<Decodable>>;

    Payload() = default;
    Payload(const Payload&) = delete;
    Payload& operator=(const Payload&) = delete;
    // The moved-from payload is left pristine.
    Payload(Payload&& other);
    Payload& operator=(Payload&& other);

    Payload& withNull(bool enable = true);
    Payload& withBoolean(bool enable = true);
    Payload& withString(bool enable = true);

    // Number mappings are mutually exclusive: the last enabled one wins.
    // withNumber(false) stops accepting numbers whatever the mapping, the
    // others only when the mapping they name is the active one.
    Payload& withNumber(bool enable = true);
    Payload& withInt(bool enable = true);
    Payload& withUint(bool enable = true);
    Payload& withFloat(bool enable = true);

    // Without a factory the default target is used. An empty factory
    // (nullptr) stops accepting the type.
    Payload& withObject();
    Payload& withObject(Factory factory);
    Payload& withArray();
    Payload& withArray(Factory factory);

    bool accepts(JsonType t) const noexcept;

    // Decode a JSON text. Throws EmptyInput or UnknownType from type_of,
    // UnexpectedType for a type that is not accepted, and ParseError,
    // NumberError or TypeError when the text does not decode into the
    // configured target. On failure mapping() is Invalid.
    void decode(std::string_view json);

    // Decodable hook, so a Payload can be a member of a larger target.
    void from_json(const Value& value) override;
    Value to_json() const override;

    // JSON type found by the last decode, even when it was rejected.
    JsonType jsonType() const noexcept { return json_type_; }
    Mapping mapping() const noexcept { return mapping_; }

    std::pair<Data, Mapping> get() const { return {data_, mapping_}; }

    bool isNil() const noexcept { return mapping_ == Mapping::Nil; }
    bool getBool() const;
    const std::string& getString() const;
    int64_t getInt() const;
    uint64_t getUint() const;
    double getFloat() const;
    std::shared_ptr<Decodable> getComposite() const;
    std::shared_ptr<Decodable> getObject() const { return getComposite(); }
    std::shared_ptr<Decodable> getArray() const { return getComposite(); }

    // The value of a composite decoded into a Typed<T> target.
    template <typename T>
    T& getAs() { return typed<T>().get(); }

    template <typename T>
    const T& getAs() const { return typed<T>().get(); }

    // Forget both the decoded value and the configuration.
    void reset() noexcept;

    // true when indistinguishable from a default constructed Payload
    bool isPristine() const noexcept;

  private:
    template <typename T>
    Typed<T>& typed() const {
        auto target = std::dynamic_pointer_cast<Typed<T>>(getComposite());
        if (!target) throw MappingError("composite of the requested type", "composite of another type");
        return *target;
    }

    void clear() noexcept;
    void require(Mapping m) const;
    std::shared_ptr<Decodable> prepare() const;
    void store(const Value& value, std::shared_ptr<Decodable> target);

    bool accept_null_ = false;
    bool accept_bool_ = false;
    bool accept_string_ = false;
    Mapping number_ = Mapping::Invalid;
    Factory object_factory_;
    Factory array_factory_;

    JsonType json_type_ = JsonType::Invalid;
    Mapping mapping_ = Mapping::Invalid;
    Data data_;
};

// Encode a value returned by Payload::get().
Value to_json(const Payload::Data& data);

}  // namespace jv
