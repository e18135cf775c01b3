#pragma once

#include "ind/rsi_result.h"
#include "util/config.h"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

enum class Direction { Overbought, Oversold };

// Per-symbol input of one run.
struct SymbolRsi {
  std::string symbol;
  std::unordered_map<int, RsiResult> results;  // period -> result
  bool fetch_failed = false;

  const RsiResult* get(int period) const {
    auto it = results.find(period);
    return it == results.end() ? nullptr : &it->second;
  }
};

struct ExtremeEvent {
  std::string symbol;
  std::string period_label;
  Direction direction;
  double rsi;
  std::optional<double> price = std::nullopt;
};

class ExtremeDetector {
  const ThresholdConfig thresholds;

 public:
  explicit ExtremeDetector(ThresholdConfig thresholds)
      : thresholds{std::move(thresholds)} {}

  // Events in symbol order, then in configured period order. At most one
  // event per symbol per period.
  std::vector<ExtremeEvent> detect(const std::vector<SymbolRsi>& symbols) const;

 private:
  std::optional<Direction> classify(const PeriodThreshold& th,
                                    double rsi) const;
};
