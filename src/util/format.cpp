#include "util/format.h"
#include "ind/rsi.h"
#include "sig/extremes.h"
#include "util/config.h"

#include <cmath>
#include <string>
#include <vector>

template <>
std::string to_str(const double& v) {
  return std::format("{:.2f}", v);
}

template <>
std::string to_str(const Direction& dir) {
  switch (dir) {
    case Direction::Overbought:
      return "超买";
    case Direction::Oversold:
      return "超卖";
  }
  return "";
}

template <>
std::string to_str(const RsiResult& res) {
  return std::visit(
      overloaded{
          [](const RsiValue& v) { return to_str(v.rsi); },
          [](const InsufficientData&) {
            return std::string{"insufficient data"};
          },
          [](const FetchError& e) { return "error: " + e.detail; },
      },
      res);
}

template <>
std::string to_str(const PeriodThreshold& th) {
  return std::format("{} 超买≥{:g} / 超卖≤{:g}", period_label(th.period),
                     th.overbought, th.oversold);
}

std::string fmt_usd(double amount) {
  auto digits = std::format("{:.2f}", std::abs(amount));
  auto dot = digits.find('.');

  std::string grouped;
  for (size_t i = 0; i < dot; i++) {
    if (i > 0 && (dot - i) % 3 == 0)
      grouped += ',';
    grouped += digits[i];
  }

  auto sign = amount < 0 && digits != "0.00" ? "-" : "";
  return std::format("{}${}{}", sign, grouped, digits.substr(dot));
}

template <>
std::string to_str<FormatTarget::Markdown>(const ExtremeEvent& ev) {
  auto price = ev.price ? fmt_usd(*ev.price) : std::string{"--"};
  return std::format("| {} | {} | {:.2f} | {} |",  //
                     ev.symbol, ev.period_label, ev.rsi, price);
}

template <>
std::string to_str<FormatTarget::Console>(
    const std::vector<SymbolRsi>& symbols,
    const ThresholdConfig& thresholds) {
  std::string str = std::format("{:=<50}\nRSI 结果摘要\n{:=<50}\n", "", "");

  for (auto& th : thresholds.periods) {
    str += std::format("\n{} Results:\n{:-<30}\n", period_label(th.period), "");
    for (auto& sym : symbols) {
      auto* res = sym.get(th.period);
      auto val = res == nullptr ? std::string{"--"} : to_str(*res);
      str += std::format("{:>8}: {:>6}\n", sym.symbol, val);
    }
  }

  return str;
}
