#include "core/notifier.h"

#include <cpr/cpr.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <format>
#include <optional>

using nlohmann::json;

namespace {

std::string url_encode(const std::string& str) {
  auto enc = cpr::util::urlEncode(str);
  return std::string(enc.begin(), enc.end());
}

}  // namespace

PushEndpoint::PushEndpoint(std::string name,
                           std::string url_template,
                           const FetchConfig& cfg,
                           SleepFn sleep)
    : endpoint_name{std::move(name)},
      url_template{std::move(url_template)},
      timeout{cfg.timeout_s},
      backoff{cfg.retry_attempts, milliseconds{cfg.backoff_base_ms},
              std::move(sleep)} {}

std::string PushEndpoint::url(const std::string& title,
                              const std::string& body) const {
  auto enc_title = url_encode(title);
  auto enc_body = url_encode(body);

  try {
    return std::vformat(url_template,
                        std::make_format_args(enc_title, enc_body));
  } catch (const std::format_error& e) {
    spdlog::error("[push] ({}) bad url template: {}", endpoint_name, e.what());
    return "";
  }
}

bool PushEndpoint::try_send(const std::string& url) const {
  auto r = cpr::Get(cpr::Url{url}, cpr::Timeout{timeout});

  if (r.status_code != 200) {
    spdlog::error("[push] ({}) error {}: {}", endpoint_name, r.status_code,
                  r.status_code == 0 ? r.error.message : r.text.substr(0, 200));
    return false;
  }

  auto js = json::parse(r.text, nullptr, false);
  if (!js.is_discarded() && js.is_object() &&
      ((js.contains("code") && js["code"] == 0) ||
       (js.contains("errno") && js["errno"] == 0)))
    spdlog::info("[push] ({}) confirmed", endpoint_name);
  else
    spdlog::warn("[push] ({}) unconfirmed response: {}", endpoint_name,
                 r.text.substr(0, 200));

  return true;
}

bool PushEndpoint::send(const std::string& title,
                        const std::string& body) const {
  auto u = url(title, body);
  if (u == "")
    return false;

  spdlog::debug("[push] ({}) {}...", endpoint_name, u.substr(0, 100));

  auto res = backoff.run(endpoint_name, [&]() -> std::optional<bool> {
    if (try_send(u))
      return true;
    return std::nullopt;
  });
  return res.has_value();
}

TelegramEndpoint::TelegramEndpoint(std::string token,
                                   std::string chat_id,
                                   const FetchConfig& cfg,
                                   SleepFn sleep)
    : token{std::move(token)},
      chat_id{std::move(chat_id)},
      timeout{cfg.timeout_s},
      backoff{cfg.retry_attempts, milliseconds{cfg.backoff_base_ms},
              std::move(sleep)} {}

std::string TelegramEndpoint::text(const std::string& title,
                                   const std::string& body) {
  return std::format("*{}*\n\n{}", title, body);
}

bool TelegramEndpoint::try_send(const std::string& text) const {
  auto url = std::format("https://api.telegram.org/bot{}/sendMessage", token);
  auto r = cpr::Post(cpr::Url{url},
                     cpr::Payload{{"chat_id", chat_id},
                                  {"text", text},
                                  {"parse_mode", "Markdown"}},
                     cpr::Timeout{timeout});

  if (r.status_code != 200 || r.text == "") {
    spdlog::error("[tg] error {}: {}", r.status_code, r.text.c_str());
    return false;
  }

  auto js = json::parse(r.text, nullptr, false);
  if (js.is_discarded() || !js.contains("ok") || js["ok"] != true) {
    spdlog::error("[tg] unexpected response: {}", r.text.c_str());
    return false;
  }

  return true;
}

bool TelegramEndpoint::send(const std::string& title,
                            const std::string& body) const {
  spdlog::debug("[tg] send: {}...", title);

  auto msg = text(title, body);
  auto res = backoff.run("tg", [&]() -> std::optional<bool> {
    if (try_send(msg))
      return true;
    return std::nullopt;
  });
  return res.has_value();
}

Notifier::Notifier(const APIConfig& api,
                   const FetchConfig& cfg,
                   SleepFn sleep) {
  for (auto& [name, tpl] : api.push_urls)
    add(std::make_unique<PushEndpoint>(name, tpl, cfg, sleep));

  if (api.tg_token != "" && api.tg_chat_id != "")
    add(std::make_unique<TelegramEndpoint>(api.tg_token, api.tg_chat_id, cfg,
                                           sleep));

  spdlog::info("[notify] {} endpoints", endpoints.size());
}

DeliveryRes Notifier::deliver(const std::string& title,
                              const std::string& body) const {
  spdlog::info("[notify] sending \"{}\", {} chars", title, body.size());

  DeliveryRes res;
  for (auto& ep : endpoints) {
    bool ok = false;
    try {
      ok = ep->send(title, body);
    } catch (const std::exception& e) {
      spdlog::error("[notify] ({}) {}", ep->name(), e.what());
    }
    res[ep->name()] = ok;
    spdlog::info("[notify] ({}) {}", ep->name(), ok ? "ok" : "failed");
  }

  auto n_ok = std::count_if(res.begin(), res.end(),
                            [](auto& kv) { return kv.second; });
  if (n_ok > 0)
    spdlog::info("[notify] done: {}/{} endpoints", n_ok, res.size());
  else
    spdlog::error("[notify] all endpoints failed");

  return res;
}
