#include <jv/payload.h>
#include <jv/json.h>
#include <type_traits>

namespace jv {

const char* to_string(Mapping m) noexcept {
    switch (m) {
        case Mapping::Composite: return "composite";
        case Mapping::Nil: return "nil";
        case Mapping::String: return "string";
        case Mapping::Int: return "int";
        case Mapping::Float: return "float";
        case Mapping::Uint: return "uint";
        case Mapping::Bool: return "bool";
        case Mapping::Invalid: break;
    }
    return "invalid";
}

Payload::Payload(Payload&& other)
    : accept_null_(other.accept_null_),
      accept_bool_(other.accept_bool_),
      accept_string_(other.accept_string_),
      number_(other.number_),
      object_factory_(std::move(other.object_factory_)),
      array_factory_(std::move(other.array_factory_)),
      json_type_(other.json_type_),
      mapping_(other.mapping_),
      data_(std::move(other.data_)) {
    other.reset();
}

Payload& Payload::operator=(Payload&& other) {
    if (this == &other) return *this;
    accept_null_ = other.accept_null_;
    accept_bool_ = other.accept_bool_;
    accept_string_ = other.accept_string_;
    number_ = other.number_;
    object_factory_ = std::move(other.object_factory_);
    array_factory_ = std::move(other.array_factory_);
    json_type_ = other.json_type_;
    mapping_ = other.mapping_;
    data_ = std::move(other.data_);
    other.reset();
    return *this;
}

Payload& Payload::withNull(bool enable) {
    accept_null_ = enable;
    return *this;
}

Payload& Payload::withBoolean(bool enable) {
    accept_bool_ = enable;
    return *this;
}

Payload& Payload::withString(bool enable) {
    accept_string_ = enable;
    return *this;
}

Payload& Payload::withNumber(bool enable) {
    number_ = enable ? Mapping::Int : Mapping::Invalid;
    return *this;
}

namespace {
    // Enable `m`, or disable it when it is the active number mapping.
    void toggle_number(Mapping& active, Mapping m, bool enable) {
        if (enable) active = m;
        else if (active == m) active = Mapping::Invalid;
    }
}

Payload& Payload::withInt(bool enable) {
    toggle_number(number_, Mapping::Int, enable);
    return *this;
}

Payload& Payload::withUint(bool enable) {
    toggle_number(number_, Mapping::Uint, enable);
    return *this;
}

Payload& Payload::withFloat(bool enable) {
    toggle_number(number_, Mapping::Float, enable);
    return *this;
}

Payload& Payload::withObject() { return withObject(default_object_factory()); }

Payload& Payload::withObject(Factory factory) {
    object_factory_ = std::move(factory);
    return *this;
}

Payload& Payload::withArray() { return withArray(default_array_factory()); }

Payload& Payload::withArray(Factory factory) {
    array_factory_ = std::move(factory);
    return *this;
}

bool Payload::accepts(JsonType t) const noexcept {
    switch (t) {
        case JsonType::Object: return static_cast<bool>(object_factory_);
        case JsonType::Array: return static_cast<bool>(array_factory_);
        case JsonType::Null: return accept_null_;
        case JsonType::String: return accept_string_;
        case JsonType::Number: return number_ != Mapping::Invalid;
        case JsonType::Boolean: return accept_bool_;
        case JsonType::Invalid: break;
    }
    return false;
}

void Payload::decode(std::string_view json) {
    clear();
    json_type_ = type_of(json);
    auto target = prepare();
    Value value = parse_json(json);
    store(value, std::move(target));
}

void Payload::from_json(const Value& value) {
    clear();
    json_type_ = type_of(value);
    auto target = prepare();
    store(value, std::move(target));
}

Value Payload::to_json() const { return jv::to_json(data_); }

// Check the classified type against the configuration and build the
// composite target, if any.
std::shared_ptr<Decodable> Payload::prepare() const {
    if (not accepts(json_type_)) throw UnexpectedType(to_string(json_type_));
    std::shared_ptr<Decodable> target;
    if (json_type_ == JsonType::Object) target = object_factory_();
    else if (json_type_ == JsonType::Array) target = array_factory_();
    else return target;
    if (not target) throw UnexpectedType(to_string(json_type_));
    return target;
}

void Payload::store(const Value& value, std::shared_ptr<Decodable> target) {
    Mapping m = Mapping::Invalid;
    switch (json_type_) {
        case JsonType::Null:
            m = Mapping::Nil;
            break;
        case JsonType::Boolean:
            data_.emplace<bool>(value.as_bool());
            m = Mapping::Bool;
            break;
        case JsonType::String:
            data_.emplace<std::string>(value.as_string());
            m = Mapping::String;
            break;
        case JsonType::Number:
            if (number_ == Mapping::Int) data_.emplace<int64_t>(value.as_number().as_int());
            else if (number_ == Mapping::Uint) data_.emplace<uint64_t>(value.as_number().as_uint());
            else data_.emplace<double>(value.as_number().as_double());
            m = number_;
            break;
        case JsonType::Object:
        case JsonType::Array:
            target->from_json(value);
            data_ = std::move(target);
            m = Mapping::Composite;
            break;
        case JsonType::Invalid:
            return;
    }
    mapping_ = m;
}

void Payload::require(Mapping m) const {
    if (mapping_ != m) throw MappingError(to_string(m), to_string(mapping_));
}

bool Payload::getBool() const {
    require(Mapping::Bool);
    return std::get<bool>(data_);
}

const std::string& Payload::getString() const {
    require(Mapping::String);
    return std::get<std::string>(data_);
}

int64_t Payload::getInt() const {
    require(Mapping::Int);
    return std::get<int64_t>(data_);
}

uint64_t Payload::getUint() const {
    require(Mapping::Uint);
    return std::get<uint64_t>(data_);
}

double Payload::getFloat() const {
    require(Mapping::Float);
    return std::get<double>(data_);
}

std::shared_ptr<Decodable> Payload::getComposite() const {
    require(Mapping::Composite);
    return std::get<std::shared_ptr<Decodable>>(data_);
}

void Payload::clear() noexcept {
    data_ = std::monostate{};
    mapping_ = Mapping::Invalid;
    json_type_ = JsonType::Invalid;
}

void Payload::reset() noexcept {
    clear();
    accept_null_ = false;
    accept_bool_ = false;
    accept_string_ = false;
    number_ = Mapping::Invalid;
    object_factory_ = nullptr;
    array_factory_ = nullptr;
}

bool Payload::isPristine() const noexcept {
    for (size_t t = 0; t < kJsonTypeCount; ++t) {
        if (accepts(static_cast<JsonType>(t))) return false;
    }
    return json_type_ == JsonType::Invalid and mapping_ == Mapping::Invalid and
           std::holds_alternative<std::monostate>(data_);
}

Value to_json(const Payload::Data& data) {
    return std::visit([](const auto& x) -> Value {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, std::monostate>) return Value();
        else if constexpr (std::is_same_v<T, std::shared_ptr<Decodable>>) return x ? x->to_json() : Value();
        else return Value(x);
    }, data);
}

}  // namespace jv
