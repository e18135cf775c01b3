#include "util/config.h"

#include <argparse/argparse.hpp>
#include <glaze/glaze.hpp>

#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <iostream>

namespace fs = std::filesystem;

template <typename T>
T read(const char* path, bool dump) {
  T t{};

  if (!fs::exists(path)) {
    std::cerr << std::format("[config] {} missing, using defaults\n", path);
    return t;
  }

  auto ec = glz::read_file_json(t, path, std::string{});
  if (ec) {
    std::cerr << std::format("[config] {} error {}, using defaults\n", path,
                             glz::format_error(ec));
    t = T{};
  }

  if (T::debug && dump) {
    std::ofstream log{"logs/configs.log", std::ios::app};
    std::string buffer;
    auto _ = glz::write<glz::opts{.prettify = true}>(t, buffer);
    log << std::format("\"{}\": {}\n", T::name, buffer.c_str());
  }

  return t;
}

void Config::update() {
  std::error_code ec;
  fs::remove("logs/configs.log", ec);

  api_config = read<APIConfig>("private/api.json", debug_en);
  rsi_config = read<ThresholdConfig>("private/rsi.json", debug_en);
  fetch_config = read<FetchConfig>("private/fetch.json", debug_en);

  if (api_config.cc_api_key == "")
    if (auto* key = std::getenv("CC_API_KEY"); key != nullptr)
      api_config.cc_api_key = key;
}

bool Config::read_args(int argc, char* argv[]) {
  argparse::ArgumentParser program("rsiwatch");

  program.add_argument("-i", "--interval")
      .default_value(std::string{"1d"})
      .help("Candle interval: 1d or 4h");

  program.add_argument("-d", "--debug")
      .default_value(false)
      .implicit_value(true)
      .help("Enable debug");

  program.add_argument("-n", "--dry-run")
      .default_value(false)
      .implicit_value(true)
      .help("Print the alert without sending it");

  program.add_argument("-s", "--symbols")
      .default_value(std::vector<std::string>{})
      .nargs(argparse::nargs_pattern::at_least_one)
      .help("Only scan these symbols");

  program.add_argument("--show-config")
      .default_value(false)
      .implicit_value(true)
      .help("Print push endpoints and thresholds, then exit");

  program.add_argument("--test-push")
      .default_value(false)
      .implicit_value(true)
      .help("Send a sample alert to every endpoint, then exit");

  try {
    program.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << "\n" << program << "\n";
    return false;
  }

  auto iv = program.get<std::string>("--interval");
  if (iv == "4h") {
    interval = H_4;
  } else if (iv == "1d") {
    interval = D_1;
  } else {
    std::cerr << std::format("unknown interval \"{}\"\n", iv) << program
              << "\n";
    return false;
  }

  debug_en = program.get<bool>("--debug");
  notify_en = !program.get<bool>("--dry-run");
  only_symbols = program.get<std::vector<std::string>>("--symbols");

  if (program.get<bool>("--show-config"))
    mode = RunMode::ShowConfig;
  else if (program.get<bool>("--test-push"))
    mode = RunMode::TestPush;

  return true;
}
