#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace jv {

// Base class for every recoverable error raised by the library.
struct Error : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Input with no bytes to classify.
struct EmptyInput : public Error {
    EmptyInput() : Error("empty input") {}
};

// Input whose leading content is not a JSON value prefix.
struct UnknownType : public Error {
    UnknownType() : Error("unknown type") {}
};

// The classified JSON type is not accepted by the payload configuration,
// or a composite factory produced no target.
struct UnexpectedType : public Error {
    explicit UnexpectedType(const std::string& type)
        : Error("unexpected JSON type: " + type) {}
};

// Malformed JSON text. Line and column are 1-based.
struct ParseError : public Error {
    ParseError(const std::string& msg, size_t l, size_t c)
        : Error(msg), line_(l), col_(c) {}

    size_t line() const noexcept { return line_; }
    size_t column() const noexcept { return col_; }

  private:
    size_t line_;
    size_t col_;
};

// A number literal that does not fit the requested representation.
struct NumberError : public Error {
    NumberError(const std::string& literal, const std::string& target)
        : Error("cannot decode number " + literal + " into " + target), literal_(literal) {}

    const std::string& literal() const noexcept { return literal_; }

  private:
    std::string literal_;
};

// A decoded value whose kind does not match the decode target.
struct TypeError : public Error {
    TypeError(const std::string& expected, const std::string& actual)
        : Error("cannot decode " + actual + " into " + expected) {}
};

// Object member that is not there.
struct KeyError : public Error {
    explicit KeyError(const std::string& key)
        : Error("key not found: \"" + key + "\""), key_(key) {}

    const std::string& key() const noexcept { return key_; }

  private:
    std::string key_;
};

// Array element past the end.
struct IndexError : public Error {
    IndexError(size_t index, size_t size)
        : Error("index " + std::to_string(index) + " out of range for array of size " + std::to_string(size)) {}
};

// Contract violation: a typed accessor was called on a payload whose live
// value is of another mapping. Not part of the Error hierarchy.
struct MappingError : public std::logic_error {
    MappingError(const std::string& wanted, const std::string& live)
        : std::logic_error("unexpected mapping: wanted " + wanted + ", have " + live) {}
};

}  // namespace jv
