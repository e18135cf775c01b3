#include "sig/extremes.h"
#include "ind/rsi.h"
#include "util/format.h"

#include <spdlog/spdlog.h>

std::optional<Direction> ExtremeDetector::classify(const PeriodThreshold& th,
                                                   double rsi) const {
  if (rsi >= th.overbought)
    return Direction::Overbought;
  if (rsi <= th.oversold)
    return Direction::Oversold;
  return std::nullopt;
}

std::vector<ExtremeEvent> ExtremeDetector::detect(
    const std::vector<SymbolRsi>& symbols) const {
  std::vector<ExtremeEvent> events;

  for (auto& sym : symbols) {
    if (sym.fetch_failed)
      continue;

    for (auto& th : thresholds.periods) {
      auto* res = sym.get(th.period);
      if (res == nullptr)
        continue;

      std::visit(overloaded{
                     [&](const RsiValue& v) {
                       auto dir = classify(th, v.rsi);
                       if (!dir)
                         return;
                       spdlog::info("[extreme] ({}) {} {} {:.2f}", sym.symbol,
                                    period_label(th.period), to_str(*dir),
                                    v.rsi);
                       events.push_back({sym.symbol, period_label(th.period),
                                         *dir, v.rsi, v.price});
                     },
                     [](const InsufficientData&) {},
                     [](const FetchError&) {},
                 },
                 *res);
    }
  }

  return events;
}
