#pragma once

#include "cdp/domain/cdp_error.hpp"

#include <optional>
#include <utility>
#include <variant>

namespace cdp {

// -----------------------------------------------------------------------------
// Result<T> — value or CdpError
// -----------------------------------------------------------------------------
//
// @brief  Two-variant return type used at every engine boundary.
//
// @details
// Holds either the success value or the CdpError that stopped the
// operation. Expected validation failures are never thrown. Accessing the
// wrong side (value() on an error or error() on a value) is a programming
// error and throws std::bad_variant_access from std::get.
//
// Construction is implicit from both sides so executors can write
// `return outcome;` and `return CdpError{errors::InvalidAmount{amount}};`.
// -----------------------------------------------------------------------------
template <typename T>
class Result {
 public:
  Result(T value) : storage_(std::in_place_index<0>, std::move(value)) {}
  Result(CdpError error)
      : storage_(std::in_place_index<1>, std::move(error)) {}

  bool ok() const { return storage_.index() == 0; }
  explicit operator bool() const { return ok(); }

  const T& value() const& { return std::get<0>(storage_); }
  T& value() & { return std::get<0>(storage_); }
  T&& value() && { return std::get<0>(std::move(storage_)); }

  const CdpError& error() const { return std::get<1>(storage_); }

 private:
  std::variant<T, CdpError> storage_;
};

// -----------------------------------------------------------------------------
// Result<void> — success or CdpError
// -----------------------------------------------------------------------------
template <>
class Result<void> {
 public:
  Result() = default;
  Result(CdpError error) : error_(std::move(error)) {}

  static Result success() { return Result(); }

  bool ok() const { return !error_.has_value(); }
  explicit operator bool() const { return ok(); }

  const CdpError& error() const { return error_.value(); }

 private:
  std::optional<CdpError> error_;
};

}  // namespace cdp
