#include "sig/alert.h"
#include "util/format.h"

#include <format>

inline constexpr std::string_view table_header =
    "| 币种 | 指标 | RSI值 | 最新价格 |\n"
    "|:---|:---|---:|---:|";

inline constexpr std::string_view overbought_advice =
    "> 💡 超买区域注意回调风险，可考虑分批止盈";
inline constexpr std::string_view oversold_advice =
    "> 💡 超卖区域可能出现反弹，可关注潜在入场机会";
inline constexpr std::string_view disclaimer =
    "⚠️ 以上内容仅供参考，不构成投资建议。投资有风险，入市需谨慎。";

namespace {

std::string section(std::string_view heading,
                    const std::vector<const ExtremeEvent*>& events,
                    std::string_view advice) {
  std::string str = std::format("### {} ({})\n{}\n", heading, events.size(),
                                table_header);
  for (auto* ev : events)
    str += to_str<FormatTarget::Markdown>(*ev) + "\n";
  str += std::format("\n{}\n\n", advice);
  return str;
}

}  // namespace

std::string MessageComposer::title(
    size_t n_overbought,
    size_t n_oversold,
    const std::optional<std::string>& timeframe_label) const {
  auto prefix = timeframe_label ? *timeframe_label + " | " : std::string{};
  return std::format("{}RSI-{}个超买,{}个超卖信号", prefix, n_overbought,
                     n_oversold);
}

std::string MessageComposer::footer() const {
  std::vector<std::string> lines;
  for (auto& th : thresholds.periods)
    lines.push_back(to_str(th));

  return std::format("---\n📌 阈值说明: {}\n{}",  //
                     join(lines.begin(), lines.end(), "; "), disclaimer);
}

AlertMessage MessageComposer::compose(
    const std::vector<ExtremeEvent>& events,
    const std::optional<std::string>& timeframe_label,
    LocalTimePoint now) const {
  if (events.empty())
    return {"", ""};

  std::vector<const ExtremeEvent*> overbought, oversold;
  for (auto& ev : events) {
    if (ev.direction == Direction::Overbought)
      overbought.push_back(&ev);
    else
      oversold.push_back(&ev);
  }

  auto label = timeframe_label ? std::format("RSI {} 极值分析", *timeframe_label)
                               : std::string{"RSI 极值分析"};

  std::string body = std::format("## 📊 {}\n检测时间: {}\n\n",  //
                                 label, datetime_to_string(now));

  if (!overbought.empty())
    body += section("🔴 超买信号", overbought, overbought_advice);

  if (!oversold.empty())
    body += section("🟢 超卖信号", oversold, oversold_advice);

  body += footer();

  return {title(overbought.size(), oversold.size(), timeframe_label), body};
}
