#include <gtest/gtest.h>
#include "core/scanner.h"
#include "fakes.h"
#include "series_helpers.h"

#include <memory>
#include <vector>

class ScannerTest : public ::testing::Test {
 protected:
  Config config;
  Symbols symbols{std::vector<SymbolInfo>{
      {"BTC", "bitcoin"}, {"ETH", "ethereum"}, {"SOL", "solana"}}};
  FakeSource source;
  Notifier notifier;
  FakeEndpoint* endpoint = nullptr;

  std::vector<milliseconds> waits;
  bool allow_sleep = true;

  LocalTimePoint now = datetime_to_local("2025-09-12 14:30:00");

  void SetUp() override {
    auto ep = std::make_unique<FakeEndpoint>("fake", true);
    endpoint = ep.get();
    notifier.add(std::move(ep));
  }

  Scanner scanner() {
    return Scanner{config, symbols, source, notifier, [this](milliseconds d) {
                     waits.push_back(d);
                     return allow_sleep;
                   }};
  }
};

TEST_F(ScannerTest, FailedSymbolDoesNotStopOthers) {
  source.data.emplace("BTC", daily_series(ramp(100, 1, 31)));
  source.data.emplace("ETH", FetchError{"http 502"});
  source.data.emplace("SOL", daily_series(ramp(200, -1, 31)));

  auto report = scanner().run(now);

  EXPECT_EQ(source.requested, (std::vector<std::string>{"BTC", "ETH", "SOL"}));
  ASSERT_EQ(report.symbols.size(), 3u);
  EXPECT_EQ(report.n_failed(), 1u);
  EXPECT_TRUE(report.symbols[1].fetch_failed);
  EXPECT_TRUE(std::holds_alternative<FetchError>(*report.symbols[1].get(14)));

  // rising BTC: both periods overbought; falling SOL: both oversold
  ASSERT_EQ(report.events.size(), 4u);
  EXPECT_EQ(report.events[0].symbol, "BTC");
  EXPECT_EQ(report.events[3].symbol, "SOL");
  EXPECT_EQ(report.message.title, "RSI-2个超买,2个超卖信号");

  ASSERT_TRUE(report.delivery.has_value());
  EXPECT_TRUE(Notifier::succeeded(*report.delivery));
  ASSERT_EQ(endpoint->sent.size(), 1u);
  EXPECT_EQ(endpoint->sent[0].first, report.message.title);
}

TEST_F(ScannerTest, WaitsBetweenRequestsOnly) {
  config.fetch_config.daily_delay_s = 20;
  for (auto sym : {"BTC", "ETH", "SOL"})
    source.data.emplace(sym, daily_series({1, 2}));

  scanner().run(now);

  EXPECT_EQ(waits, (std::vector<milliseconds>{seconds{20}, seconds{20}}));
}

TEST_F(ScannerTest, FourHourIntervalUsesItsDelayAndLabel) {
  config.interval = H_4;
  config.fetch_config.h4_delay_s = 5;
  source.data.emplace("BTC", daily_series(ramp(100, 1, 31)));
  source.data.emplace("ETH", daily_series(ramp(100, 1, 31)));
  source.data.emplace("SOL", daily_series(ramp(100, 1, 31)));

  auto report = scanner().run(now);

  EXPECT_EQ(waits, (std::vector<milliseconds>{seconds{5}, seconds{5}}));
  EXPECT_EQ(report.message.title.rfind("4H | ", 0), 0u);
}

TEST_F(ScannerTest, NeutralRunSendsNothing) {
  auto wobble = std::vector<double>{};
  for (int i = 0; i < 5; i++)
    wobble.insert(wobble.end(), {100, 99, 100, 101});
  wobble.push_back(100);
  source.data.emplace("BTC", daily_series(wobble));
  source.data.emplace("ETH", FetchError{"timeout"});
  source.data.emplace("SOL", daily_series({5}));

  auto report = scanner().run(now);

  EXPECT_TRUE(report.events.empty());
  EXPECT_TRUE(report.message.empty());
  EXPECT_FALSE(report.delivery.has_value());
  EXPECT_TRUE(endpoint->sent.empty());
  EXPECT_TRUE(
      std::holds_alternative<InsufficientData>(*report.symbols[2].get(14)));
}

TEST_F(ScannerTest, DryRunComposesWithoutSending) {
  config.notify_en = false;
  source.data.emplace("BTC", daily_series(ramp(100, 1, 31)));

  auto report = scanner().run(now);

  EXPECT_FALSE(report.message.empty());
  EXPECT_FALSE(report.delivery.has_value());
  EXPECT_TRUE(endpoint->sent.empty());
}

TEST_F(ScannerTest, InterruptedWaitEndsFetching) {
  allow_sleep = false;
  source.data.emplace("BTC", daily_series(ramp(100, 1, 31)));
  source.data.emplace("ETH", daily_series(ramp(100, 1, 31)));

  auto report = scanner().run(now);

  EXPECT_EQ(source.requested, (std::vector<std::string>{"BTC"}));
  ASSERT_EQ(report.symbols.size(), 1u);
  EXPECT_EQ(report.events.size(), 2u);
  EXPECT_TRUE(report.delivery.has_value());
}

TEST_F(ScannerTest, ScanSymbolComputesEveryPeriod) {
  source.data.emplace("BTC", daily_series(ramp(100, 1, 10)));

  auto sym = scanner().scan_symbol(symbols[0]);

  EXPECT_FALSE(sym.fetch_failed);
  EXPECT_TRUE(std::holds_alternative<InsufficientData>(*sym.get(14)));
  auto* v = rsi_value(*sym.get(6));
  ASSERT_NE(v, nullptr);
  EXPECT_DOUBLE_EQ(v->rsi, 100.0);
  EXPECT_DOUBLE_EQ(v->price, 109.0);
}
