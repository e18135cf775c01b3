#pragma once

#include "core/backoff.h"
#include "util/config.h"

#include <map>
#include <memory>
#include <string>
#include <vector>

class Endpoint {
 public:
  virtual ~Endpoint() = default;

  virtual std::string name() const = 0;
  virtual bool send(const std::string& title,
                    const std::string& body) const = 0;
};

// GET on a url template whose two {} take the url-encoded title and body
// (ServerChan, PushDeer).
class PushEndpoint : public Endpoint {
  const std::string endpoint_name;
  const std::string url_template;
  const seconds timeout;
  const Backoff backoff;

  bool try_send(const std::string& url) const;

 public:
  PushEndpoint(std::string name,
               std::string url_template,
               const FetchConfig& cfg,
               SleepFn sleep = plain_sleep);

  std::string name() const override { return endpoint_name; }
  bool send(const std::string& title, const std::string& body) const override;

  // empty when the template can't be formatted
  std::string url(const std::string& title, const std::string& body) const;
};

class TelegramEndpoint : public Endpoint {
  const std::string token;
  const std::string chat_id;
  const seconds timeout;
  const Backoff backoff;

  bool try_send(const std::string& text) const;

 public:
  TelegramEndpoint(std::string token,
                   std::string chat_id,
                   const FetchConfig& cfg,
                   SleepFn sleep = plain_sleep);

  std::string name() const override { return "telegram"; }
  bool send(const std::string& title, const std::string& body) const override;

  static std::string text(const std::string& title, const std::string& body);
};

using DeliveryRes = std::map<std::string, bool>;

class Notifier {
  std::vector<std::unique_ptr<Endpoint>> endpoints;

 public:
  Notifier() = default;
  Notifier(const APIConfig& api, const FetchConfig& cfg, SleepFn sleep);

  void add(std::unique_ptr<Endpoint> ep) { endpoints.push_back(std::move(ep)); }

  auto size() const { return endpoints.size(); }
  bool empty() const { return endpoints.empty(); }

  // Tries every endpoint, even after a failure.
  DeliveryRes deliver(const std::string& title, const std::string& body) const;

  static bool succeeded(const DeliveryRes& res) {
    for (auto& [_, ok] : res)
      if (ok)
        return true;
    return false;
  }
};
