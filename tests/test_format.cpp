#include <gtest/gtest.h>
#include "ind/rsi_result.h"
#include "sig/extremes.h"
#include "util/config.h"
#include "util/format.h"

TEST(FormatTest, UsdGroupsThousands) {
  EXPECT_EQ(fmt_usd(63123.45), "$63,123.45");
  EXPECT_EQ(fmt_usd(1234567.891), "$1,234,567.89");
  EXPECT_EQ(fmt_usd(123456.0), "$123,456.00");
  EXPECT_EQ(fmt_usd(1000.0), "$1,000.00");
}

TEST(FormatTest, UsdSmallAmounts) {
  EXPECT_EQ(fmt_usd(9.82), "$9.82");
  EXPECT_EQ(fmt_usd(0.0), "$0.00");
  EXPECT_EQ(fmt_usd(999.999), "$1,000.00");
  EXPECT_EQ(fmt_usd(0.00042), "$0.00");
}

TEST(FormatTest, UsdNegative) {
  EXPECT_EQ(fmt_usd(-1234.5), "-$1,234.50");
  EXPECT_EQ(fmt_usd(-0.001), "$0.00");
}

TEST(FormatTest, RsiResultToString) {
  EXPECT_EQ(to_str(RsiResult{RsiValue{72.5, 1.0}}), "72.50");
  EXPECT_EQ(to_str(RsiResult{InsufficientData{}}), "insufficient data");
  EXPECT_EQ(to_str(RsiResult{FetchError{"http 429"}}), "error: http 429");
}

TEST(FormatTest, DirectionToString) {
  EXPECT_EQ(to_str(Direction::Overbought), "超买");
  EXPECT_EQ(to_str(Direction::Oversold), "超卖");
}

TEST(FormatTest, MarkdownRow) {
  ExtremeEvent ev{"ETH", "RSI-6", Direction::Oversold, 28.3, 3123.11};
  EXPECT_EQ(to_str<FormatTarget::Markdown>(ev),
            "| ETH | RSI-6 | 28.30 | $3,123.11 |");
}

TEST(FormatTest, Join) {
  std::vector<std::string> v{"a", "b", "c"};
  EXPECT_EQ(join(v.begin(), v.end()), "a, b, c");
  EXPECT_EQ(join(v.begin(), v.begin() + 1, "; "), "a");
}

TEST(FormatTest, ConsoleSummaryListsEveryPeriod) {
  SymbolRsi btc{"BTC", {}, false};
  btc.results.emplace(14, RsiValue{72.5, 1.0});
  btc.results.emplace(6, InsufficientData{});

  SymbolRsi eth{"ETH", {}, true};
  eth.results.emplace(14, FetchError{"timeout"});
  eth.results.emplace(6, FetchError{"timeout"});

  auto str = to_str<FormatTarget::Console>(std::vector<SymbolRsi>{btc, eth},
                                           ThresholdConfig{});

  auto rsi14 = str.find("RSI-14 Results:");
  auto rsi6 = str.find("RSI-6 Results:");
  ASSERT_NE(rsi14, std::string::npos);
  ASSERT_NE(rsi6, std::string::npos);
  EXPECT_LT(rsi14, rsi6);
  EXPECT_NE(str.find("     BTC:  72.50"), std::string::npos);
  EXPECT_NE(str.find("error: timeout"), std::string::npos);
  EXPECT_NE(str.find("insufficient data"), std::string::npos);
}

TEST(FormatTest, ThresholdToString) {
  EXPECT_EQ(to_str(PeriodThreshold{14, 65, 35}), "RSI-14 超买≥65 / 超卖≤35");
  EXPECT_EQ(to_str(PeriodThreshold{6, 72.5, 27.5}), "RSI-6 超买≥72.5 / 超卖≤27.5");
}
