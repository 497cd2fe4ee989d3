#pragma once

#include <algorithm>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include "tanki/common.hpp"
#include "tanki/config.hpp"
#include "tanki/context_assembler.hpp"
#include "tanki/http.hpp"
#include "tanki/provider.hpp"

namespace tanki {

// Replaces raw user mentions ("<@id>", "<@!id>") with "@name", the way the Discord
// client renders them.
inline std::string clean_discord_content(const json& message) {
  std::string text = message.value("content", "");
  if (!message.contains("mentions") || !message["mentions"].is_array()) {
    return trim(text);
  }
  for (const auto& user : message["mentions"]) {
    if (!user.is_object() || !user.contains("id") || !user["id"].is_string()) {
      continue;
    }
    const std::string id = user["id"].get<std::string>();
    std::string name;
    if (user.contains("global_name") && user["global_name"].is_string()) {
      name = user["global_name"].get<std::string>();
    }
    if (name.empty()) {
      name = user.value("username", id);
    }
    for (const std::string& token : {"<@" + id + ">", "<@!" + id + ">"}) {
      std::size_t pos = 0;
      while ((pos = text.find(token, pos)) != std::string::npos) {
        text.replace(pos, token.size(), "@" + name);
        pos += name.size() + 1;
      }
    }
  }
  return trim(text);
}

// Discord returns newest-first; the order is preserved here.
inline std::vector<PlatformMessage> parse_discord_messages(const std::string& body) {
  json arr;
  try {
    arr = json::parse(body);
  } catch (const json::exception& e) {
    throw BackendError(std::string("malformed Discord messages response: ") + e.what());
  }
  if (!arr.is_array()) {
    throw BackendError("Discord messages response is not an array");
  }

  std::vector<PlatformMessage> out;
  out.reserve(arr.size());
  for (const auto& m : arr) {
    if (!m.is_object() || !m.contains("content") || !m["content"].is_string()) {
      continue;
    }
    PlatformMessage msg;
    if (m.contains("author") && m["author"].is_object()) {
      msg.author_is_bot = m["author"].value("bot", false);
    }
    msg.text = clean_discord_content(m);
    out.push_back(std::move(msg));
  }
  return out;
}

class DiscordHistorySource : public HistorySource {
 public:
  explicit DiscordHistorySource(const DiscordConfig& config)
      : config_(config),
        api_base_(trim(config.api_base).empty() ? "https://discord.com/api/v10" : trim(config.api_base)) {}

  std::vector<PlatformMessage> fetch_recent(const std::string& channel_id, std::size_t limit) override {
    if (trim(config_.token).empty()) {
      throw BackendError("Discord token is not configured");
    }
    const std::size_t n = std::clamp<std::size_t>(limit, 1, 100);
    const std::string url = api_base_ + "/channels/" + channel_id + "/messages?limit=" + std::to_string(n);

    thread_local HttpClient client;
    HttpResponse resp = client.get(url, {{"Authorization", "Bot " + config_.token}}, config_.timeout);
    if (resp.status == 429) {
      const auto it = resp.headers.find("retry-after");
      const int wait_s = it == resp.headers.end() ? 3 : (std::max)(1, std::atoi(it->second.c_str()));
      Logger::log(Logger::Level::kWarn, "Discord rate limited. Retrying in " + std::to_string(wait_s) + "s");
      std::this_thread::sleep_for(std::chrono::seconds(wait_s));
      resp = client.get(url, {{"Authorization", "Bot " + config_.token}}, config_.timeout);
    }

    if (!resp.error.empty()) {
      throw BackendError("Discord history fetch failed: " + resp.error);
    }
    if (resp.status < 200 || resp.status >= 300) {
      throw BackendError("Discord history fetch failed (HTTP " + std::to_string(resp.status) + ")");
    }

    std::vector<PlatformMessage> out = parse_discord_messages(resp.body);
    if (out.size() > limit) {
      out.resize(limit);
    }
    return out;
  }

 private:
  DiscordConfig config_;
  std::string api_base_;
};

}  // namespace tanki
