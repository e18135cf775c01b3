#pragma once

#include "util/times.h"

#include <stdexcept>
#include <string>
#include <vector>

struct PricePoint {
  SysTimePoint datetime;
  double price = 0.0;

  SysTimePoint time() const { return datetime; }
};

class MalformedSeries : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Non-empty, strictly increasing timestamps. Input is validated, never
// reordered.
class PriceSeries {
  std::vector<PricePoint> points;

 public:
  explicit PriceSeries(std::vector<PricePoint>&& pts);

  auto size() const { return points.size(); }

  double price(int idx) const { return points[sanitize(idx)].price; }
  SysTimePoint time(int idx) const { return points[sanitize(idx)].time(); }

  double last_price() const { return points.back().price; }
  SysTimePoint last_time() const { return points.back().time(); }

  std::vector<double> prices() const;

  auto begin() const { return points.begin(); }
  auto end() const { return points.end(); }

 private:
  size_t sanitize(int idx) const {
    return idx < 0 ? points.size() + idx : idx;
  }
};
