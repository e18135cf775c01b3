#include "util/symbols.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

#include <spdlog/spdlog.h>

namespace {

std::vector<SymbolInfo> default_symbols() {
  return {
      {"BTC", "bitcoin"},
      {"ETH", "ethereum"},
      {"BNB", "binancecoin"},
      {"SOL", "solana"},
      {"JLP", "jupiter-perpetuals-liquidity-provider-token"},
      {"PENDLE", "pendle"},
      {"PENPIE", "penpie"},
      {"EQB", "equilibria-finance"},
      {"SUI", "sui"},
      {"APT", "aptos"},
      {"DEEP", "deep"},
      {"WAL", "walrus-2"},
      {"BGB", "bitget-token"},
      {"MNT", "mantle"},
      {"SPK", "spark-2"},
      {"WLD", "worldcoin-wld"},
      {"ENA", "ethena"},
  };
}

}  // namespace

Symbols::Symbols() noexcept : Symbols{"private/symbols.csv"} {}

Symbols::Symbols(const std::string& path) noexcept {
  if (!std::filesystem::exists(path)) {
    arr = default_symbols();
    spdlog::info("[init] {} missing, {} default symbols", path, arr.size());
    return;
  }

  std::ifstream file(path);
  std::string line;

  std::getline(file, line);

  while (std::getline(file, line)) {
    std::istringstream ss(line);
    std::string symbol, id;

    if (std::getline(ss, symbol, ',') && std::getline(ss, id, ',') &&
        symbol != "" && id != "")
      arr.emplace_back(symbol, id);
    else if (line != "")
      spdlog::warn("[init] skipping symbol line \"{}\"", line);
  }

  spdlog::info("[init] {} symbols", arr.size());
}

Symbols Symbols::only(const std::vector<std::string>& symbols) const {
  std::vector<SymbolInfo> res;
  for (auto& sym : symbols) {
    auto it = std::find_if(arr.begin(), arr.end(),
                           [&](auto& si) { return si.symbol == sym; });
    if (it == arr.end()) {
      spdlog::warn("[init] unknown symbol {}", sym);
      continue;
    }
    res.push_back(*it);
  }
  return Symbols{std::move(res)};
}

std::unordered_map<std::string, std::string> Symbols::coingecko_ids() const {
  std::unordered_map<std::string, std::string> ids;
  for (auto& si : arr)
    ids.emplace(si.symbol, si.coingecko_id);
  return ids;
}
