#pragma once

#include <string>
#include <type_traits>
#include <variant>

struct RsiValue {
  double rsi = 0.0;
  double price = 0.0;  // last price of the series
};

struct InsufficientData {};

struct FetchError {
  std::string detail;
};

using RsiResult = std::variant<RsiValue, InsufficientData, FetchError>;

template <typename... Fs>
struct overloaded : Fs... {
  using Fs::operator()...;
};

inline const RsiValue* rsi_value(const RsiResult& res) {
  return std::get_if<RsiValue>(&res);
}
