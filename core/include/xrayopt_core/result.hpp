#pragma once
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace xrayopt {

  template <typename T, typename E> class Result;

  /// Wraps an error so it can be returned where a Result is expected
  template <typename E> class Unexpected {
  public:
    explicit constexpr Unexpected(const E& err) : error_(err) {}
    explicit constexpr Unexpected(E&& err) : error_(std::move(err)) {}

    constexpr const E& error() const& noexcept { return error_; }
    constexpr E&& error() && noexcept { return std::move(error_); }

  private:
    E error_;
  };

  template <typename E> Unexpected(E) -> Unexpected<E>;

  /// Value or error, shaped after std::expected. Accessing the wrong alternative throws
  /// std::runtime_error.
  template <typename T, typename E> class Result {
    static_assert(!std::is_same_v<T, E>, "Result value and error types must differ");

  public:
    constexpr Result(const T& value) : storage_(value) {}
    constexpr Result(T&& value) : storage_(std::move(value)) {}

    template <typename U> constexpr Result(const Unexpected<U>& err) : storage_(E(err.error())) {}
    template <typename U> constexpr Result(Unexpected<U>&& err)
        : storage_(E(std::move(err).error())) {}

    [[nodiscard]] constexpr bool has_value() const noexcept {
      return std::holds_alternative<T>(storage_);
    }
    [[nodiscard]] constexpr explicit operator bool() const noexcept { return has_value(); }

    [[nodiscard]] constexpr T& value() & {
      if (!has_value()) {
        throw std::runtime_error("Result contains error");
      }
      return std::get<T>(storage_);
    }

    [[nodiscard]] constexpr const T& value() const& {
      if (!has_value()) {
        throw std::runtime_error("Result contains error");
      }
      return std::get<T>(storage_);
    }

    [[nodiscard]] constexpr T&& value() && {
      if (!has_value()) {
        throw std::runtime_error("Result contains error");
      }
      return std::get<T>(std::move(storage_));
    }

    [[nodiscard]] constexpr const E& error() const& {
      if (has_value()) {
        throw std::runtime_error("Result contains value");
      }
      return std::get<E>(storage_);
    }

    [[nodiscard]] constexpr T& operator*() & { return value(); }
    [[nodiscard]] constexpr const T& operator*() const& { return value(); }

    [[nodiscard]] constexpr T* operator->() { return &value(); }
    [[nodiscard]] constexpr const T* operator->() const { return &value(); }

  private:
    std::variant<T, E> storage_;
  };

}  // namespace xrayopt
