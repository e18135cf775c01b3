#pragma once

#include "util/times.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

struct PeriodThreshold {
  int period = 14;
  double overbought = 65;
  double oversold = 35;
};

struct ThresholdConfig {
  static constexpr const char* name = "rsi_config";
  static constexpr bool debug = true;

  // evaluated in this order
  std::vector<PeriodThreshold> periods = {{14, 65, 35}, {6, 70, 30}};
};

struct FetchConfig {
  static constexpr const char* name = "fetch_config";
  static constexpr bool debug = true;

  int timeout_s = 30;
  int retry_attempts = 3;
  int backoff_base_ms = 1000;

  std::string coingecko_url = "https://api.coingecko.com/api/v3";
  std::string cryptocompare_url =
      "https://min-api.cryptocompare.com/data/v2/histohour";

  int daily_days = 30;
  int daily_delay_s = 20;

  int h4_limit = 100;
  int h4_delay_s = 5;
};

struct APIConfig {
  static constexpr const char* name = "api_config";
  static constexpr bool debug = false;

  std::string cc_api_key;

  std::string tg_token;
  std::string tg_chat_id;

  // name -> url template with {} for title and {} for body
  std::map<std::string, std::string> push_urls = {};
};

enum class RunMode {
  Scan,
  ShowConfig,
  TestPush,
};

struct Config {
  bool debug_en = false;
  bool notify_en = true;
  RunMode mode = RunMode::Scan;

  minutes interval = D_1;
  std::vector<std::string> only_symbols = {};

  APIConfig api_config;
  ThresholdConfig rsi_config;
  FetchConfig fetch_config;

  Config() = default;

  // Returns false when the arguments could not be parsed.
  bool read_args(int argc, char* argv[]);
  void update();

  std::optional<std::string> timeframe_label() const {
    if (interval == H_4)
      return "4H";
    return std::nullopt;
  }

  int lookback() const {
    return interval == H_4 ? fetch_config.h4_limit : fetch_config.daily_days;
  }

  seconds request_delay() const {
    return seconds{interval == H_4 ? fetch_config.h4_delay_s
                                   : fetch_config.daily_delay_s};
  }
};
