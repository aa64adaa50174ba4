#pragma once
#include <string>
#include <utility>
template<typename T> struct Result {
  T value{};
  bool ok{true};
  std::string err{};
  static Result<T> success(T v){ return {std::move(v), true, {}}; }
  static Result<T> failure(std::string e){ return {{}, false, std::move(e)}; }
  explicit operator bool() const { return ok; }
};
