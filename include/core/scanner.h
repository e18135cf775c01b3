#pragma once

#include "core/data_source.h"
#include "core/notifier.h"
#include "sig/alert.h"
#include "sig/extremes.h"
#include "util/config.h"
#include "util/symbols.h"
#include "util/times.h"

#include <optional>
#include <string>
#include <vector>

struct ScanReport {
  std::vector<SymbolRsi> symbols;
  std::vector<ExtremeEvent> events;
  AlertMessage message;
  std::optional<DeliveryRes> delivery = std::nullopt;

  size_t n_failed() const {
    size_t n = 0;
    for (auto& sym : symbols)
      n += sym.fetch_failed;
    return n;
  }
};

// One run: fetch every symbol, compute RSI per configured period, detect
// extremes, compose and deliver the alert.
class Scanner {
  const Config& config;
  const Symbols& symbols;
  DataSource& source;
  const Notifier& notifier;
  const SleepFn sleep;

  const ExtremeDetector detector;
  const MessageComposer composer;

 public:
  Scanner(const Config& config,
          const Symbols& symbols,
          DataSource& source,
          const Notifier& notifier,
          SleepFn sleep = plain_sleep)
      : config{config},
        symbols{symbols},
        source{source},
        notifier{notifier},
        sleep{std::move(sleep)},
        detector{config.rsi_config},
        composer{config.rsi_config}  //
  {}

  SymbolRsi scan_symbol(const SymbolInfo& si);
  ScanReport run(LocalTimePoint now);
};
