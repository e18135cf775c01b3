#include "core/scanner.h"
#include "ind/rsi.h"
#include "util/format.h"

#include <spdlog/spdlog.h>

SymbolRsi Scanner::scan_symbol(const SymbolInfo& si) {
  SymbolRsi res{si.symbol, {}, false};

  auto fetched = source.fetch_series(si.symbol, config.lookback());

  if (auto* err = std::get_if<FetchError>(&fetched)) {
    res.fetch_failed = true;
    for (auto& th : config.rsi_config.periods)
      res.results.emplace(th.period, *err);
    return res;
  }

  auto& series = std::get<PriceSeries>(fetched);
  for (auto& th : config.rsi_config.periods) {
    auto rsi = compute_rsi(series, th.period);
    spdlog::info("[scan] ({}) {}: {}", si.symbol, period_label(th.period),
                 to_str(rsi));
    res.results.emplace(th.period, std::move(rsi));
  }
  spdlog::info("[scan] ({}) latest price: {}", si.symbol,
               fmt_usd(series.last_price()));

  return res;
}

ScanReport Scanner::run(LocalTimePoint now) {
  ScanReport report;

  Timer timer;
  for (size_t i = 0; i < symbols.size(); i++) {
    auto& si = symbols[i];
    spdlog::info("[scan] processing {} ({}/{})", si.symbol, i + 1,
                 symbols.size());

    report.symbols.push_back(scan_symbol(si));

    if (i + 1 == symbols.size())
      break;

    auto delay = config.request_delay();
    spdlog::debug("[scan] waiting {}s before next request", delay.count());
    if (!sleep(delay)) {
      spdlog::warn("[scan] interrupted after {} symbols", i + 1);
      break;
    }
  }

  spdlog::info("[scan] fetched {} symbols ({} failed) in {:.2f}s",
               report.symbols.size(), report.n_failed(), timer.diff_s());

  report.events = detector.detect(report.symbols);
  report.message =
      composer.compose(report.events, config.timeframe_label(), now);

  if (report.message.empty()) {
    spdlog::info("[scan] no extreme RSI values");
    return report;
  }

  if (!config.notify_en) {
    spdlog::info("[scan] dry run, not sending \"{}\"", report.message.title);
    return report;
  }

  report.delivery =
      notifier.deliver(report.message.title, report.message.body);
  return report;
}
