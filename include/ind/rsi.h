#pragma once

#include "ind/price_series.h"
#include "ind/rsi_result.h"

#include <string>
#include <vector>

// Wilder-smoothed RSI, alpha = 1/period, seeded by the first delta.
// values[i] is the RSI after the (i+1)th delta, so a series of n prices
// yields n-1 values. Empty when there are fewer than period+1 prices.
struct RSI {
  std::vector<double> values;

 private:
  int period;

  double last_price = 0.0;
  double avg_gain = 0.0;
  double avg_loss = 0.0;

 public:
  RSI(const std::vector<double>& prices, int period = 14) noexcept;
  RSI(const PriceSeries& series, int period = 14) noexcept
      : RSI{series.prices(), period} {}

  void push_back(double price) noexcept;

  bool empty() const { return values.empty(); }
  double last() const { return values.back(); }

 private:
  void update(double change) noexcept;
  double value() const noexcept;
};

RsiResult compute_rsi(const PriceSeries& series, int period) noexcept;

inline std::string period_label(int period) {
  return "RSI-" + std::to_string(period);
}
