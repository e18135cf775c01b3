#include "core/data_source.h"
#include "core/notifier.h"
#include "core/scanner.h"
#include "mt/sleeper.h"
#include "sig/alert.h"
#include "util/config.h"
#include "util/format.h"
#include "util/symbols.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>
#include <memory>

namespace fs = std::filesystem;

inline void init_logging(const Config& config) {
  auto pwd = fs::current_path().generic_string();
  auto log_name = std::format("{}/logs/{:%F_%R}.log", pwd,
                              std::chrono::floor<minutes>(SysClock::now()));
  auto link_name = pwd + "/logs/output.log";

  std::error_code ec;
  fs::remove(link_name, ec);
  fs::create_symlink(log_name, link_name, ec);

  auto file_logger = spdlog::basic_logger_mt("file_logger", log_name);
  spdlog::set_default_logger(file_logger);

  auto level = config.debug_en ? spdlog::level::debug : spdlog::level::info;
  spdlog::set_level(level);
  spdlog::flush_on(level);

  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v");
}

inline void ensure_directories_exist(const std::vector<std::string>& dirs) {
  for (const auto& dir : dirs) {
    fs::path path{dir};
    if (fs::exists(path))
      continue;
    std::error_code ec;
    if (fs::create_directories(path, ec))
      std::cout << "Created: " << dir << '\n';
    else
      std::cerr << "Failed to create: " << dir << '\n';
  }
}

inline std::string banner(std::string_view heading) {
  return std::format("\n{:=<50}\n{}\n{:=<50}\n", "", heading, "");
}

int show_config(const Config& config) {
  std::cout << banner("当前推送接口配置");
  for (auto& [name, url] : config.api_config.push_urls)
    std::cout << std::format("{}:\n  URL: {}\n\n", name, url);
  if (config.api_config.tg_token != "")
    std::cout << std::format("telegram:\n  chat: {}\n\n",
                             config.api_config.tg_chat_id);

  Notifier notifier{config.api_config, config.fetch_config, plain_sleep};
  std::cout << std::format("总计配置了 {} 个推送接口\n", notifier.size());

  std::cout << banner("RSI 阈值");
  for (auto& th : config.rsi_config.periods)
    std::cout << to_str(th) << '\n';

  return 0;
}

std::vector<ExtremeEvent> sample_events() {
  return {
      {"BTC", "RSI-14", Direction::Overbought, 72.50, 63123.45},
      {"ETH", "RSI-6", Direction::Oversold, 28.30, 3123.11},
      {"SOL", "RSI-14", Direction::Overbought, 68.20, 154.92},
      {"APT", "RSI-6", Direction::Oversold, 25.80, 9.82},
  };
}

int test_push(const Config& config, Sleeper& sleeper) {
  Notifier notifier{config.api_config, config.fetch_config,
                    sleeper.sleep_fn()};
  MessageComposer composer{config.rsi_config};

  auto msg = composer.compose(sample_events(), config.timeframe_label(),
                              now_local_time());

  std::cout << banner("测试推送") << "标题: " << msg.title << "\n\n"
            << msg.body << '\n';

  auto res = notifier.deliver(msg.title, msg.body);
  for (auto& [name, ok] : res)
    std::cout << std::format("- {}: {}\n", name, ok ? "成功" : "失败");

  return Notifier::succeeded(res) ? 0 : 1;
}

int scan(const Config& config, Sleeper& sleeper) {
  auto symbols = config.only_symbols.empty()
                     ? Symbols{}
                     : Symbols{}.only(config.only_symbols);
  if (symbols.empty()) {
    std::cerr << "no symbols to scan\n";
    return 1;
  }

  std::unique_ptr<DataSource> source;
  if (config.interval == H_4)
    source = std::make_unique<CryptoCompareSource>(
        config.fetch_config, config.api_config.cc_api_key, sleeper.sleep_fn());
  else
    source = std::make_unique<CoinGeckoSource>(
        config.fetch_config, symbols.coingecko_ids(), sleeper.sleep_fn());

  Notifier notifier{config.api_config, config.fetch_config,
                    sleeper.sleep_fn()};

  spdlog::info("[main] {} scan of {} symbols via {}",
               interval_to_str(config.interval), symbols.size(),
               source->name());

  Scanner scanner{config, symbols, *source, notifier, sleeper.sleep_fn()};
  auto report = scanner.run(now_local_time());

  std::cout << to_str<FormatTarget::Console>(report.symbols,
                                             config.rsi_config);

  std::cout << banner("最终发送的通知消息");
  if (report.message.empty())
    std::cout << "没有发现极端RSI值，无需发送提醒。\n";
  else
    std::cout << "标题: " << report.message.title << "\n内容:\n"
              << report.message.body << '\n';

  if (report.delivery)
    for (auto& [name, ok] : *report.delivery)
      std::cout << std::format("- {}: {}\n", name, ok ? "成功" : "失败");

  if (!report.symbols.empty() &&
      report.n_failed() == report.symbols.size())
    return 1;
  if (report.delivery && !Notifier::succeeded(*report.delivery))
    return 1;
  return 0;
}

int main(int argc, char* argv[]) {
  Config config;
  if (!config.read_args(argc, argv))
    return 2;

  ensure_directories_exist({"logs", "private"});
  config.update();
  init_logging(config);

  if (config.mode == RunMode::ShowConfig)
    return show_config(config);

  Sleeper sleeper;

  if (config.mode == RunMode::TestPush)
    return test_push(config, sleeper);

  auto rc = scan(config, sleeper);
  spdlog::info("[exit] main {}", rc);
  return rc;
}
