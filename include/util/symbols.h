#pragma once

#include <string>
#include <unordered_map>
#include <vector>

struct SymbolInfo {
  std::string symbol;
  std::string coingecko_id;
};

struct Symbols {
  std::vector<SymbolInfo> arr;

  Symbols() noexcept;
  explicit Symbols(const std::string& path) noexcept;
  explicit Symbols(std::vector<SymbolInfo> arr) noexcept
      : arr{std::move(arr)} {}

  // keeps the listed symbols, in list order; unknown ones are logged
  Symbols only(const std::vector<std::string>& symbols) const;

  std::unordered_map<std::string, std::string> coingecko_ids() const;

  auto size() const { return arr.size(); }
  bool empty() const { return arr.empty(); }

  auto& operator[](size_t x) const { return arr[x]; }

  auto begin() const { return arr.begin(); }
  auto end() const { return arr.end(); }
};
