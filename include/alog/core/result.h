#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <variant>

namespace alog::core {

// Error categories surfaced by the access log core.
// Not-found is deliberately absent: missing rows are empty results, zero counts or no-ops.
enum class ErrorCode {
  kInvalidIdentifier,         // text cannot be parsed into a 128-bit id
  kInvalidAddress,            // text is neither an IPv4 nor an IPv6 address
  kInvalidArgument,           // field violates a record or query invariant
  kCollision,                 // create targeted an id that already exists
  kUnsupportedAddressFamily,  // anonymization met an address that is not IPv4/IPv6
  kBackend,                   // storage engine failure
};

struct Error {
  ErrorCode code;
  std::string message;
};

[[nodiscard]] const char* to_string(ErrorCode code);

// Result<T, E> follows C++ Core Guidelines E.27: systematic error handling without exceptions.
// Usage: return Result<Value, Error>::ok(val) or Result<Value, Error>::err(error).
// The has_value() check makes error handling mandatory and visible at call sites.
template <typename T, typename E = Error>
class Result {
 public:
  static Result ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }
  static Result err(E error) { return Result(std::in_place_index<1>, std::move(error)); }

  [[nodiscard]] bool has_value() const { return data_.index() == 0; }
  [[nodiscard]] const T& value() const { return std::get<0>(data_); }
  [[nodiscard]] T& value() { return std::get<0>(data_); }
  [[nodiscard]] const E& error() const { return std::get<1>(data_); }

 private:
  template <std::size_t I, typename V>
  Result(std::in_place_index_t<I> tag, V&& v) : data_(tag, std::forward<V>(v)) {}

  std::variant<T, E> data_;
};

// Shorthand for building an Error result of any value type.
template <typename T>
[[nodiscard]] Result<T, Error> fail(ErrorCode code, std::string message) {
  return Result<T, Error>::err(Error{code, std::move(message)});
}

}  // namespace alog::core
