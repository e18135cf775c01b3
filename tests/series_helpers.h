#pragma once

#include "ind/price_series.h"

#include <vector>

// One point per day starting at 2023-11-14.
inline PriceSeries daily_series(const std::vector<double>& prices) {
  std::vector<PricePoint> pts;
  for (size_t i = 0; i < prices.size(); i++)
    pts.push_back({from_unix_seconds(1'700'000'000 + int64_t(i) * 86'400),
                   prices[i]});
  return PriceSeries{std::move(pts)};
}

inline std::vector<double> ramp(double start, double step, size_t n) {
  std::vector<double> v;
  for (size_t i = 0; i < n; i++)
    v.push_back(start + step * double(i));
  return v;
}
