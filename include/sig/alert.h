#pragma once

#include "sig/extremes.h"
#include "util/config.h"
#include "util/times.h"

#include <optional>
#include <string>
#include <vector>

struct AlertMessage {
  std::string title;
  std::string body;

  // empty title and body: nothing to notify
  bool empty() const { return title == "" && body == ""; }
};

class MessageComposer {
  const ThresholdConfig thresholds;

 public:
  explicit MessageComposer(ThresholdConfig thresholds)
      : thresholds{std::move(thresholds)} {}

  AlertMessage compose(const std::vector<ExtremeEvent>& events,
                       const std::optional<std::string>& timeframe_label,
                       LocalTimePoint now) const;

 private:
  std::string title(size_t n_overbought,
                    size_t n_oversold,
                    const std::optional<std::string>& timeframe_label) const;
  std::string footer() const;
};
