#pragma once

#include "core/backoff.h"
#include "ind/price_series.h"
#include "ind/rsi_result.h"
#include "util/config.h"

#include <optional>
#include <string>
#include <unordered_map>
#include <variant>

using FetchRes = std::variant<PriceSeries, FetchError>;

class DataSource {
 public:
  virtual ~DataSource() = default;

  virtual std::string name() const = 0;

  // Ascending price series for one symbol, or the terminal error after the
  // retry policy gave up.
  virtual FetchRes fetch_series(const std::string& symbol, int lookback) = 0;
};

class HttpSource : public DataSource {
 protected:
  const FetchConfig cfg;
  const Backoff backoff;

  // nullopt: transient failure, worth another attempt
  virtual std::optional<FetchRes> try_fetch(const std::string& symbol,
                                            int lookback) = 0;

 public:
  HttpSource(FetchConfig cfg, SleepFn sleep)
      : cfg{std::move(cfg)},
        backoff{this->cfg.retry_attempts,
                milliseconds{this->cfg.backoff_base_ms}, std::move(sleep)} {}

  FetchRes fetch_series(const std::string& symbol, int lookback) override;
};

// Daily closes from CoinGecko's market_chart endpoint.
class CoinGeckoSource : public HttpSource {
  const std::unordered_map<std::string, std::string> ids;

 protected:
  std::optional<FetchRes> try_fetch(const std::string& symbol,
                                    int lookback) override;

 public:
  CoinGeckoSource(FetchConfig cfg,
                  std::unordered_map<std::string, std::string> ids,
                  SleepFn sleep = plain_sleep)
      : HttpSource{std::move(cfg), std::move(sleep)}, ids{std::move(ids)} {}

  std::string name() const override { return "cg"; }
};

// 4-hour closes from CryptoCompare's histohour endpoint (aggregate=4).
class CryptoCompareSource : public HttpSource {
  const std::string api_key;

 protected:
  std::optional<FetchRes> try_fetch(const std::string& symbol,
                                    int lookback) override;

 public:
  CryptoCompareSource(FetchConfig cfg,
                      std::string api_key,
                      SleepFn sleep = plain_sleep)
      : HttpSource{std::move(cfg), std::move(sleep)},
        api_key{std::move(api_key)} {}

  std::string name() const override { return "cc"; }
};

// Payload decoding. nullopt when the text is not the expected JSON.
std::optional<FetchRes> decode_coingecko_chart(const std::string& json);
std::optional<FetchRes> decode_cryptocompare_histo(const std::string& json);
