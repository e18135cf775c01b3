#pragma once

#include <concepts>
#include <format>
#include <string>
#include <type_traits>

enum class FormatTarget {
  None,
  Console,
  Markdown,
};

template <FormatTarget target, typename T>
std::string to_str(const T& t);

template <FormatTarget target, typename T, typename S>
std::string to_str(const T& t, const S& s);

template <typename T>
std::string to_str(const T& t);

template <typename Str>
  requires std::constructible_from<std::string, Str>
std::string to_str(const Str& str) {
  return std::string{str};
}

template <FormatTarget target = FormatTarget::None>
inline std::string join(auto start, auto end, std::string sep = ", ") {
  std::string result;

  for (auto it = start; it != end; it++) {
    if constexpr (target == FormatTarget::None)
      result += to_str(*it);
    else
      result += to_str<target>(*it);

    auto _end = end;
    if (it != --_end)
      result += sep;
  }

  return result;
}

// $1,234.56
std::string fmt_usd(double amount);
