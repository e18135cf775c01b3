#include "util/times.h"

#include <spdlog/spdlog.h>

#include <format>
#include <sstream>

using namespace std::chrono;

LocalTimePoint now_local_time() {
  zoned_time now_zt{current_zone(), system_clock::now()};
  return floor<seconds>(now_zt.get_local_time());
}

std::string datetime_to_string(LocalTimePoint tp) {
  return std::format("{:%F %T}", tp);
}

std::string datetime_to_string(SysTimePoint tp) {
  return std::format("{:%F %T}", tp);
}

LocalTimePoint datetime_to_local(std::string_view datetime,
                                 std::string_view fmt) {
  if (datetime == "") {
    spdlog::error("[time] empty datetime string");
    return {};
  }

  std::istringstream in{std::string(datetime)};
  LocalTimePoint local;
  in >> parse(std::string(fmt), local);

  if (in.fail()) {
    spdlog::error("[time] can't parse \"{}\" as {}", datetime, fmt);
    return {};
  }

  return local;
}

std::string interval_to_str(minutes interval) {
  if (interval == H_4)
    return "4h";
  if (interval == D_1)
    return "1d";
  return std::format("{}m", interval.count());
}
