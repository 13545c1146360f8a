#pragma once

#include <cstddef>
#include <utility>
#include <variant>

namespace fguard::core {

// Result<T, E> encodes success (T) or failure (E) explicitly, preventing ignored errors.
// Used where parsing untrusted configuration or input can fail (schema files, rule
// descriptions, request sources).
// Usage: return Result<Value, ErrorType>::ok(val) or Result<Value, ErrorType>::err(error).
template <typename T, typename E>
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
  Result(std::in_place_index_t<I> tag, V&& value) : data_(tag, std::forward<V>(value)) {}

  std::variant<T, E> data_;
};

}  // namespace fguard::core
