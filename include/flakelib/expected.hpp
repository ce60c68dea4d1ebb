#pragma once

#include <optional>
#include <system_error>
#include <utility>

namespace flakelib {

// 値またはエラーコードを保持する戻り値型
// T はデフォルト構築不要（ムーブのみの型も可）
template<typename T>
class Result {
public:
  Result(const T& value) : value_(value) {}
  Result(T&& value) : value_(std::move(value)) {}
  Result(std::error_code ec) : ec_(ec) {}

  bool has_value() const noexcept { return value_.has_value(); }
  explicit operator bool() const noexcept { return value_.has_value(); }
  const T& value() const& { return *value_; }
  T& value() & { return *value_; }
  T&& value() && { return std::move(*value_); }
  const std::error_code& error() const { return ec_; }

  template<typename U>
  T value_or(U&& fallback) const& {
    return value_ ? *value_ : static_cast<T>(std::forward<U>(fallback));
  }

private:
  std::optional<T> value_;
  std::error_code ec_{};
};

} // namespace flakelib
