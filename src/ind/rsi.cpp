#include "ind/rsi.h"

RSI::RSI(const std::vector<double>& prices, int period) noexcept
    : values(), period(period) {
  if (period < 1 || prices.size() < size_t(period + 1))
    return;

  values.reserve(prices.size() - 1);
  last_price = prices[0];

  // seed directly with the first delta
  double change = prices[1] - prices[0];
  avg_gain = change > 0 ? change : 0.0;
  avg_loss = change < 0 ? -change : 0.0;
  values.push_back(value());
  last_price = prices[1];

  for (size_t i = 2; i < prices.size(); ++i)
    push_back(prices[i]);
}

void RSI::push_back(double price) noexcept {
  if (values.empty())
    return;

  double change = price - last_price;
  last_price = price;
  update(change);
  values.push_back(value());
}

void RSI::update(double change) noexcept {
  double gain = change > 0 ? change : 0.0;
  double loss = change < 0 ? -change : 0.0;

  double alpha = 1.0 / period;
  avg_gain = alpha * gain + (1.0 - alpha) * avg_gain;
  avg_loss = alpha * loss + (1.0 - alpha) * avg_loss;
}

double RSI::value() const noexcept {
  if (avg_loss == 0.0)
    return avg_gain == 0.0 ? 50.0 : 100.0;
  if (avg_gain == 0.0)
    return 0.0;

  double rs = avg_gain / avg_loss;
  double rsi = 100.0 - (100.0 / (1.0 + rs));
  return rsi < 0.0 ? 0.0 : (rsi > 100.0 ? 100.0 : rsi);
}

RsiResult compute_rsi(const PriceSeries& series, int period) noexcept {
  RSI rsi{series, period};
  if (rsi.empty())
    return InsufficientData{};
  return RsiValue{rsi.last(), series.last_price()};
}
