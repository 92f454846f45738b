// rsema/basic/result.hpp - Value-or-error return type for solver entry points
//
// Every fallible operation in the semantic core returns a Result instead of
// throwing. The error alternative is a structured value (TypeError,
// LifetimeError, ...); turning it into user-facing text is the driver's job.
//
// Usage:
//   Result<const Type *, TypeError> r = solver.solve_expr(expr);
//   if (!r) { report(r.error()); return; }
//   const Type * t = r.value();
//
#pragma once

#include <cassert>
#include <cstddef>
#include <optional>
#include <utility>
#include <variant>

namespace rsema
{

/**
 * Holds either a success value of type T or an error of type E.
 *
 * Construction goes through the named factories so that T and E may be the
 * same type without ambiguity.
 */
template <typename T, typename E>
class Result
{
public:
  using value_type = T;
  using error_type = E;

  /// Create a successful result
  static Result ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }

  /// Create a failed result
  static Result fail(E error) { return Result(std::in_place_index<1>, std::move(error)); }

  [[nodiscard]] bool is_ok() const noexcept { return storage_.index() == 0; }
  [[nodiscard]] bool is_err() const noexcept { return storage_.index() == 1; }
  explicit operator bool() const noexcept { return is_ok(); }

  [[nodiscard]] const T & value() const &
  {
    assert(is_ok() && "value() called on failed Result");
    return std::get<0>(storage_);
  }

  [[nodiscard]] T & value() &
  {
    assert(is_ok() && "value() called on failed Result");
    return std::get<0>(storage_);
  }

  [[nodiscard]] T && value() &&
  {
    assert(is_ok() && "value() called on failed Result");
    return std::get<0>(std::move(storage_));
  }

  [[nodiscard]] const E & error() const &
  {
    assert(is_err() && "error() called on successful Result");
    return std::get<1>(storage_);
  }

  [[nodiscard]] E && error() &&
  {
    assert(is_err() && "error() called on successful Result");
    return std::get<1>(std::move(storage_));
  }

private:
  template <size_t I, typename... Args>
  explicit Result(std::in_place_index_t<I> tag, Args &&... args)
  : storage_(tag, std::forward<Args>(args)...)
  {
  }

  std::variant<T, E> storage_;
};

/**
 * Result specialization for operations that only report failure.
 */
template <typename E>
class Result<void, E>
{
public:
  using value_type = void;
  using error_type = E;

  static Result ok() { return Result(); }

  static Result fail(E error)
  {
    Result r;
    r.error_ = std::move(error);
    return r;
  }

  [[nodiscard]] bool is_ok() const noexcept { return !error_.has_value(); }
  [[nodiscard]] bool is_err() const noexcept { return error_.has_value(); }
  explicit operator bool() const noexcept { return is_ok(); }

  [[nodiscard]] const E & error() const &
  {
    assert(is_err() && "error() called on successful Result");
    return *error_;
  }

  [[nodiscard]] E && error() &&
  {
    assert(is_err() && "error() called on successful Result");
    return std::move(*error_);
  }

private:
  Result() = default;

  std::optional<E> error_;
};

}  // namespace rsema
