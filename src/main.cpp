#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "tanki/config.hpp"
#include "tanki/context_assembler.hpp"
#include "tanki/conversation_store.hpp"
#include "tanki/discord_history.hpp"
#include "tanki/metrics.hpp"
#include "tanki/provider.hpp"
#include "tanki/token_estimator.hpp"
#include "tanki/turn_processor.hpp"

namespace {

using namespace tanki;

constexpr const char* kEmptyReplyPlaceholder = "...";

void print_usage() {
  std::cout << "tanki - short-term conversation memory for a Gemini chat responder\n\n"
            << "Usage:\n"
            << "  tanki onboard\n"
            << "  tanki status\n"
            << "  tanki chat [-c CHANNEL_ID] [-m MESSAGE] [--no-history]\n"
            << "  tanki --version\n";
}

bool has_flag(const std::vector<std::string>& args, const std::string& flag) {
  return std::find(args.begin(), args.end(), flag) != args.end();
}

std::string get_flag_value(const std::vector<std::string>& args, const std::string& flag,
                           const std::string& fallback = "") {
  for (std::size_t i = 0; i + 1 < args.size(); ++i) {
    if (args[i] == flag) {
      return args[i + 1];
    }
  }
  return fallback;
}

std::string mask_secret(const std::string& s) {
  if (s.empty()) {
    return "not set";
  }
  if (s.size() <= 6) {
    return "***";
  }
  return s.substr(0, 3) + "***" + s.substr(s.size() - 3);
}

void configure_logging(const Config& cfg) {
  const char* json_env = std::getenv("TANKI_LOG_JSON");
  if (json_env && *json_env && std::string(json_env) != "0") {
    Logger::set_json(true);
  }
  Logger::set_min_level(Logger::parse_level(env_or("TANKI_LOG_LEVEL", cfg.log_level), Logger::Level::kInfo));
}

int run_onboard() {
  const fs::path config_path = get_config_path();
  if (fs::exists(config_path)) {
    std::cout << "Config already exists: " << config_path.string() << "\n";
    return 0;
  }
  if (!save_default_config(config_path)) {
    std::cerr << "Failed to write config: " << config_path.string() << "\n";
    return 1;
  }
  std::cout << "Created config: " << config_path.string() << "\n";
  std::cout << "Next: set GEMINI_API_KEY, DISCORD_TOKEN and TARGET_CHANNEL_ID or edit the config.\n";
  return 0;
}

int run_status() {
  const fs::path config_path = get_config_path();
  const Config cfg = load_config(config_path);

  std::cout << "tanki status\n\n";
  std::cout << "Config: " << config_path.string() << (fs::exists(config_path) ? " [ok]" : " [missing]") << "\n";
  std::cout << "Model: " << cfg.gemini.model << "\n";
  std::cout << "Gemini key: " << mask_secret(cfg.gemini.api_key) << "\n";
  std::cout << "Discord token: " << mask_secret(cfg.discord.token) << "\n";
  std::cout << "Target channel: " << (cfg.discord.channel_id.empty() ? "not set" : cfg.discord.channel_id) << "\n";
  std::cout << "Memory: " << cfg.memory.max_age_minutes << " min, " << cfg.memory.max_messages << " messages, "
            << cfg.memory.token_limit << " tokens, " << cfg.memory.history_fetch_limit << " fetched\n";

  const std::string raw = read_text_file(default_metrics_path());
  std::cout << "Metrics: " << (trim(raw).empty() ? "(no snapshot yet)" : raw) << "\n";
  return 0;
}

void print_turn(const TurnResult& result) {
  if (!result.ok) {
    std::cout << "Sorry, an error occurred.\n`" << result.error << "`\n";
    return;
  }
  std::cout << (result.reply.empty() ? kEmptyReplyPlaceholder : result.reply) << "\n";
}

int run_chat(const std::vector<std::string>& args) {
  const Config cfg = load_config();
  configure_logging(cfg);

  if (trim(cfg.gemini.api_key).empty()) {
    std::cerr << "Gemini API key is not set (config gemini.apiKey or GEMINI_API_KEY).\n";
    return 1;
  }

  std::string channel_id = trim(get_flag_value(args, "-c", get_flag_value(args, "--channel", cfg.discord.channel_id)));
  if (channel_id.empty()) {
    channel_id = "cli";
  }
  const std::string message = get_flag_value(args, "-m", get_flag_value(args, "--message"));

  GeminiProvider provider(cfg.gemini.api_key, cfg.gemini.api_base, cfg.gemini.model, cfg.gemini.count_timeout,
                          cfg.gemini.generate_timeout);
  TokenEstimator estimator(&provider);
  ConversationStore store(cfg.memory.eviction_limits(), estimator);

  const bool snowflake = std::all_of(channel_id.begin(), channel_id.end(),
                                     [](unsigned char c) { return std::isdigit(c) != 0; });
  std::unique_ptr<DiscordHistorySource> discord;
  if (!has_flag(args, "--no-history") && snowflake && !trim(cfg.discord.token).empty()) {
    discord = std::make_unique<DiscordHistorySource>(cfg.discord);
    Logger::log(Logger::Level::kInfo, "Fetching live history from Discord channel " + channel_id);
  }

  TurnProcessor turns(&store, &provider, discord.get(),
                      ContextAssembler(static_cast<std::size_t>(cfg.memory.history_fetch_limit)));

  if (!message.empty()) {
    const TurnResult result = turns.process(channel_id, message);
    print_turn(result);
    write_metrics_snapshot();
    return result.ok ? 0 : 1;
  }

  std::cout << "tanki interactive mode on channel " << channel_id << " (type exit to quit)\n\n";
  while (true) {
    std::cout << "You: ";
    std::string line;
    if (!std::getline(std::cin, line)) {
      break;
    }
    const std::string text = trim(line);
    if (text.empty()) {
      continue;
    }
    if (text == "exit" || text == "quit") {
      break;
    }
    print_turn(turns.process(channel_id, text));
    std::cout << "\n";
  }

  write_metrics_snapshot();
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  std::vector<std::string> args;
  args.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    args.emplace_back(argv[i]);
  }

  if (args.size() <= 1) {
    print_usage();
    return 0;
  }

  const std::string command = args[1];

  if (command == "--version" || command == "-v") {
    std::cout << "tanki v0.1.0\n";
    return 0;
  }
  if (command == "onboard") {
    return run_onboard();
  }
  if (command == "status") {
    return run_status();
  }
  if (command == "chat") {
    std::vector<std::string> sub(args.begin() + 2, args.end());
    return run_chat(sub);
  }

  print_usage();
  return 1;
}
