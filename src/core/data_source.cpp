#include "core/data_source.h"

#include <cpr/cpr.h>
#include <spdlog/spdlog.h>
#include <glaze/glaze.hpp>

#include <array>
#include <cstdint>
#include <format>
#include <vector>

struct cg_chart_t {
  std::vector<std::array<double, 2>> prices;
};

struct cc_bar_t {
  int64_t time = 0;
  double close = 0.0;
};

struct cc_bars_t {
  std::vector<cc_bar_t> Data;
};

struct cc_histo_t {
  std::string Response;
  std::string Message;
  cc_bars_t Data;
};

inline constexpr auto json_opts = glz::opts{
    .error_on_unknown_keys = false,
};

namespace {

FetchRes make_series(std::vector<PricePoint>&& points) {
  if (points.empty())
    return FetchError{"no price data"};

  try {
    return PriceSeries{std::move(points)};
  } catch (const MalformedSeries& e) {
    return FetchError{std::format("malformed series: {}", e.what())};
  }
}

}  // namespace

std::optional<FetchRes> decode_coingecko_chart(const std::string& json) {
  cg_chart_t chart;
  auto ec = glz::read<json_opts>(chart, json);
  if (ec) {
    spdlog::error("[cg] json error: {}", glz::format_error(ec, json));
    return std::nullopt;
  }

  std::vector<PricePoint> points;
  points.reserve(chart.prices.size());
  for (auto& [ms, price] : chart.prices)
    points.emplace_back(from_unix_millis(static_cast<int64_t>(ms)), price);

  return make_series(std::move(points));
}

std::optional<FetchRes> decode_cryptocompare_histo(const std::string& json) {
  cc_histo_t histo;
  auto ec = glz::read<json_opts>(histo, json);
  if (ec) {
    spdlog::error("[cc] json error: {}", glz::format_error(ec, json));
    return std::nullopt;
  }

  if (histo.Response == "Error")
    return FetchError{histo.Message == "" ? "provider error" : histo.Message};

  std::vector<PricePoint> points;
  points.reserve(histo.Data.Data.size());
  for (auto& bar : histo.Data.Data)
    points.emplace_back(from_unix_seconds(bar.time), bar.close);

  return make_series(std::move(points));
}

FetchRes HttpSource::fetch_series(const std::string& symbol, int lookback) {
  auto what = std::format("{} {}", name(), symbol);
  int n_tries = 0;
  auto res = backoff.run(what, [&] {
    n_tries++;
    return try_fetch(symbol, lookback);
  });

  if (!res && n_tries < backoff.max_attempts())
    return FetchError{std::format("interrupted after {} of {} attempts",
                                  n_tries, backoff.max_attempts())};
  if (!res)
    return FetchError{std::format("failed after {} attempts", n_tries)};

  if (auto* err = std::get_if<FetchError>(&*res))
    spdlog::error("[{}] ({}) {}", name(), symbol, err->detail);
  else
    spdlog::info("[{}] ({}) {} prices", name(), symbol,
                 std::get<PriceSeries>(*res).size());

  return std::move(*res);
}

std::optional<FetchRes> CoinGeckoSource::try_fetch(const std::string& symbol,
                                                   int lookback) {
  auto it = ids.find(symbol);
  if (it == ids.end())
    return FetchError{"no coingecko id"};

  auto url = std::format("{}/coins/{}/market_chart", cfg.coingecko_url,
                         it->second);
  cpr::Parameters params{{"vs_currency", "usd"},
                         {"days", std::to_string(lookback)},
                         {"interval", "daily"}};

  auto res = cpr::Get(cpr::Url{url}, params,
                      cpr::Timeout{seconds{cfg.timeout_s}});

  if (res.status_code == 0) {
    spdlog::warn("[cg] ({}) request error: {}", symbol, res.error.message);
    return std::nullopt;
  }

  if (res.status_code != 200) {
    spdlog::warn("[cg] ({}) market_chart http error {}", symbol,
                 res.status_code);
    return std::nullopt;
  }

  return decode_coingecko_chart(res.text);
}

std::optional<FetchRes> CryptoCompareSource::try_fetch(
    const std::string& symbol,
    int lookback) {
  cpr::Parameters params{{"fsym", symbol},
                         {"tsym", "USD"},
                         {"limit", std::to_string(lookback)},
                         {"aggregate", "4"}};

  cpr::Header headers;
  if (api_key != "")
    headers["authorization"] = "Apikey " + api_key;

  spdlog::debug("[cc] ({}) requesting {}", symbol, cfg.cryptocompare_url);
  auto res = cpr::Get(cpr::Url{cfg.cryptocompare_url}, params, headers,
                      cpr::Timeout{seconds{cfg.timeout_s}});

  if (res.status_code == 0) {
    spdlog::warn("[cc] ({}) request error: {}", symbol, res.error.message);
    return std::nullopt;
  }

  if (res.status_code != 200) {
    spdlog::warn("[cc] ({}) histohour http error {}", symbol,
                 res.status_code);
    return std::nullopt;
  }

  return decode_cryptocompare_histo(res.text);
}
