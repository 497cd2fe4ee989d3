#pragma once

#include <chrono>
#include <string>

#include "tanki/common.hpp"
#include "tanki/eviction.hpp"

namespace tanki {

struct MemoryConfig {
  int max_age_minutes{10};
  int max_messages{20};
  int token_limit{7168};
  int history_fetch_limit{5};

  EvictionLimits eviction_limits() const {
    EvictionLimits limits;
    limits.max_age = std::chrono::minutes((std::max)(0, max_age_minutes));
    limits.max_messages = static_cast<std::size_t>((std::max)(0, max_messages));
    limits.token_limit = static_cast<std::size_t>((std::max)(0, token_limit));
    return limits;
  }
};

struct GeminiConfig {
  std::string api_key;
  std::string api_base{"https://generativelanguage.googleapis.com/v1beta"};
  std::string model{"gemini-1.5-flash"};
  int count_timeout{15};
  int generate_timeout{90};
};

struct DiscordConfig {
  std::string token;
  std::string api_base{"https://discord.com/api/v10"};
  std::string channel_id;
  int timeout{20};
};

struct Config {
  MemoryConfig memory{};
  GeminiConfig gemini{};
  DiscordConfig discord{};
  std::string log_level{"info"};
};

inline std::string resolve_env_ref(const std::string& value) {
  if (value.empty()) {
    return "";
  }

  // Supports "$ENV_NAME" and "${ENV_NAME}".
  if (value[0] != '$') {
    return value;
  }

  std::string env_name = value.substr(1);
  if (!env_name.empty() && env_name.front() == '{' && env_name.back() == '}') {
    env_name = env_name.substr(1, env_name.size() - 2);
  }
  if (env_name.empty()) {
    return value;
  }

  const char* v = std::getenv(env_name.c_str());
  return (v && *v) ? std::string(v) : "";
}

inline std::string env_or(const char* name, const std::string& fallback) {
  const char* v = std::getenv(name);
  return (v && *v) ? std::string(v) : fallback;
}

inline fs::path get_data_dir() {
  return expand_user_path("~/.tanki");
}

inline fs::path get_config_path() {
  return get_data_dir() / "config.json";
}

inline json default_config_json() {
  return json{
      {"memory", {{"maxAgeMinutes", 10}, {"maxMessages", 20}, {"tokenLimit", 7168}, {"historyFetchLimit", 5}}},
      {"gemini",
       {{"apiKey", "$GEMINI_API_KEY"},
        {"apiBase", "https://generativelanguage.googleapis.com/v1beta"},
        {"model", "gemini-1.5-flash"},
        {"countTimeout", 15},
        {"generateTimeout", 90}}},
      {"discord",
       {{"token", "$DISCORD_TOKEN"},
        {"apiBase", "https://discord.com/api/v10"},
        {"channelId", "$TARGET_CHANNEL_ID"},
        {"timeout", 20}}},
      {"logLevel", "info"}};
}

// Discord snowflakes may be written as numbers or strings.
inline std::string id_value(const json& obj, const char* key, const std::string& fallback) {
  if (!obj.contains(key)) {
    return fallback;
  }
  const json& v = obj[key];
  if (v.is_string()) {
    return resolve_env_ref(v.get<std::string>());
  }
  if (v.is_number_unsigned()) {
    return std::to_string(v.get<unsigned long long>());
  }
  if (v.is_number_integer()) {
    return std::to_string(v.get<long long>());
  }
  return fallback;
}

inline Config load_config(const fs::path& path = get_config_path()) {
  Config cfg{};
  const std::string raw = read_text_file(path);

  if (!trim(raw).empty()) {
    try {
      const json root = json::parse(raw);

      if (root.contains("memory") && root["memory"].is_object()) {
        const auto& m = root["memory"];
        cfg.memory.max_age_minutes = m.value("maxAgeMinutes", cfg.memory.max_age_minutes);
        cfg.memory.max_messages = m.value("maxMessages", cfg.memory.max_messages);
        cfg.memory.token_limit = m.value("tokenLimit", cfg.memory.token_limit);
        cfg.memory.history_fetch_limit = m.value("historyFetchLimit", cfg.memory.history_fetch_limit);
      }

      if (root.contains("gemini") && root["gemini"].is_object()) {
        const auto& g = root["gemini"];
        cfg.gemini.api_key = resolve_env_ref(g.value("apiKey", cfg.gemini.api_key));
        cfg.gemini.api_base = g.value("apiBase", cfg.gemini.api_base);
        cfg.gemini.model = g.value("model", cfg.gemini.model);
        cfg.gemini.count_timeout = g.value("countTimeout", cfg.gemini.count_timeout);
        cfg.gemini.generate_timeout = g.value("generateTimeout", cfg.gemini.generate_timeout);
      }

      if (root.contains("discord") && root["discord"].is_object()) {
        const auto& d = root["discord"];
        cfg.discord.token = resolve_env_ref(d.value("token", cfg.discord.token));
        cfg.discord.api_base = d.value("apiBase", cfg.discord.api_base);
        cfg.discord.channel_id = id_value(d, "channelId", cfg.discord.channel_id);
        cfg.discord.timeout = d.value("timeout", cfg.discord.timeout);
      }

      cfg.log_level = root.value("logLevel", cfg.log_level);
    } catch (const std::exception& e) {
      Logger::log(Logger::Level::kWarn, std::string("Failed to parse config: ") + e.what());
      cfg = Config{};
    }
  }

  if (cfg.gemini.api_key.empty()) {
    cfg.gemini.api_key = env_or("GEMINI_API_KEY", "");
  }
  if (cfg.discord.token.empty()) {
    cfg.discord.token = env_or("DISCORD_TOKEN", "");
  }
  if (cfg.discord.channel_id.empty()) {
    cfg.discord.channel_id = env_or("TARGET_CHANNEL_ID", "");
  }
  cfg.memory.history_fetch_limit = (std::max)(0, cfg.memory.history_fetch_limit);
  cfg.gemini.count_timeout = (std::max)(1, cfg.gemini.count_timeout);
  cfg.gemini.generate_timeout = (std::max)(1, cfg.gemini.generate_timeout);
  cfg.discord.timeout = (std::max)(1, cfg.discord.timeout);
  return cfg;
}

inline bool save_default_config(const fs::path& path = get_config_path()) {
  return write_text_file(path, default_config_json().dump(2));
}

}  // namespace tanki
