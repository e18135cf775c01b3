#include "ind/price_series.h"

#include <cmath>
#include <format>

PriceSeries::PriceSeries(std::vector<PricePoint>&& pts)
    : points{std::move(pts)} {
  if (points.empty())
    throw MalformedSeries("empty price series");

  for (size_t i = 0; i < points.size(); i++) {
    if (!std::isfinite(points[i].price))
      throw MalformedSeries(std::format("non-finite price at {}",
                                        datetime_to_string(points[i].time())));

    if (i == 0)
      continue;

    auto prev = points[i - 1].time();
    auto curr = points[i].time();
    if (curr == prev)
      throw MalformedSeries(
          std::format("duplicate timestamp {}", datetime_to_string(curr)));
    if (curr < prev)
      throw MalformedSeries(std::format("timestamp {} after {}",  //
                                        datetime_to_string(curr),
                                        datetime_to_string(prev)));
  }
}

std::vector<double> PriceSeries::prices() const {
  std::vector<double> res;
  res.reserve(points.size());
  for (auto& p : points)
    res.push_back(p.price);
  return res;
}
