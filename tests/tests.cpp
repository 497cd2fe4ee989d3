#include <chrono>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <stdexcept>
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

static int fail(const std::string& msg, const char* file, int line) {
  std::cerr << "TEST FAIL: " << msg << " (" << file << ":" << line << ")\n";
  return 1;
}

#define EXPECT_TRUE(x)                     \
  do {                                     \
    if (!(x)) {                            \
      return fail(#x, __FILE__, __LINE__); \
    }                                      \
  } while (0)

#define EXPECT_EQ(a, b)                                                      \
  do {                                                                       \
    const auto _a = (a);                                                     \
    const auto _b = (b);                                                     \
    if (!(_a == _b)) {                                                       \
      std::ostringstream ss;                                                 \
      ss << #a << " == " << #b << " (got '" << _a << "' vs '" << _b << "')"; \
      return fail(ss.str(), __FILE__, __LINE__);                             \
    }                                                                        \
  } while (0)

namespace {

using namespace tanki;

class SumCounter : public TokenCounter {
 public:
  int count(const std::vector<std::string>& texts) override {
    ++calls;
    return static_cast<int>(TokenEstimator::heuristic(texts));
  }

  int calls{0};
};

class FixedCounter : public TokenCounter {
 public:
  explicit FixedCounter(int n) : n_(n) {}
  int count(const std::vector<std::string>&) override { return n_; }

 private:
  int n_;
};

class FailingCounter : public TokenCounter {
 public:
  int count(const std::vector<std::string>&) override { throw BackendError("quota exceeded"); }
};

class FakeHistory : public HistorySource {
 public:
  std::vector<PlatformMessage> fetch_recent(const std::string& channel_id, std::size_t limit) override {
    last_channel = channel_id;
    last_limit = limit;
    if (fail) {
      throw BackendError("Discord unavailable");
    }
    return messages;
  }

  std::vector<PlatformMessage> messages;
  std::string last_channel;
  std::size_t last_limit{0};
  bool fail{false};
};

class FakeBackend : public GenerationBackend {
 public:
  std::string generate(const std::vector<ChatTurn>& context, const std::string& user_text) override {
    ++calls;
    last_context = context;
    last_user_text = user_text;
    if (fail) {
      throw BackendError("generation failed");
    }
    return reply;
  }

  std::string reply{"ok"};
  bool fail{false};
  int calls{0};
  std::vector<ChatTurn> last_context;
  std::string last_user_text;
};

EvictionLimits roomy_limits() {
  EvictionLimits limits;
  limits.max_age = std::chrono::minutes(10);
  limits.max_messages = 20;
  limits.token_limit = 1000000;
  return limits;
}

template <typename Fn>
bool throws_backend_error(Fn&& fn) {
  try {
    fn();
  } catch (const BackendError&) {
    return true;
  }
  return false;
}

}  // namespace

int main() {
  using namespace tanki;
  Logger::set_min_level(Logger::Level::kError);

  // Count cap keeps the most recent records, oldest first.
  {
    TokenEstimator estimator;
    ConversationStore store(roomy_limits(), estimator);
    for (int i = 0; i < 25; ++i) {
      store.add_message("general", Role::kUser, "m" + std::to_string(i));
    }
    const auto history = store.get_history("general");
    EXPECT_EQ(history.size(), static_cast<std::size_t>(20));
    EXPECT_EQ(history.front().content, "m5");
    EXPECT_EQ(history.back().content, "m24");
    for (std::size_t i = 0; i < history.size(); ++i) {
      EXPECT_EQ(history[i].content, "m" + std::to_string(i + 5));
    }
  }

  // Age filter runs on the next append; records exactly at the limit survive.
  {
    TimePoint now = TimePoint{} + std::chrono::hours(24 * 365);
    TokenEstimator estimator;
    ConversationStore store(roomy_limits(), estimator, [&now] { return now; });

    store.add_message("c", Role::kUser, "oldest");
    now += std::chrono::minutes(5);
    store.add_message("c", Role::kAssistant, "middle");
    now += std::chrono::minutes(5);
    store.add_message("c", Role::kUser, "edge");
    EXPECT_EQ(store.size("c"), static_cast<std::size_t>(3));

    now += std::chrono::minutes(1);
    store.add_message("c", Role::kAssistant, "newest");
    const auto history = store.get_history("c");
    EXPECT_EQ(history.size(), static_cast<std::size_t>(3));
    EXPECT_EQ(history[0].content, "middle");
    EXPECT_EQ(history[2].content, "newest");

    now += std::chrono::hours(1);
    store.add_message("c", Role::kUser, "later");
    EXPECT_EQ(store.size("c"), static_cast<std::size_t>(1));
    EXPECT_EQ(store.get_history("c")[0].content, "later");
  }

  // A clock stepping backwards never stamps a record earlier than its predecessor.
  {
    TimePoint now = TimePoint{} + std::chrono::minutes(20);
    TokenEstimator estimator;
    ConversationStore store(roomy_limits(), estimator, [&now] { return now; });

    store.add_message("skew", Role::kUser, "first");
    now = TimePoint{};
    store.add_message("skew", Role::kAssistant, "second");
    now = TimePoint{} + std::chrono::minutes(25);
    store.add_message("skew", Role::kUser, "third");

    const auto history = store.get_history("skew");
    EXPECT_EQ(history.size(), static_cast<std::size_t>(3));
    EXPECT_EQ(history[0].content, "first");
    EXPECT_EQ(history[1].content, "second");
    EXPECT_EQ(history[2].content, "third");
  }

  // Token budget trims oldest-first and may drive the log empty.
  {
    SumCounter counter;
    TokenEstimator estimator(&counter);
    EvictionLimits limits = roomy_limits();
    limits.token_limit = 10;
    ConversationStore store(limits, estimator);

    store.add_message("t", Role::kUser, "aaaa");
    store.add_message("t", Role::kAssistant, "bbbb");
    store.add_message("t", Role::kUser, "cccc");
    auto history = store.get_history("t");
    EXPECT_EQ(history.size(), static_cast<std::size_t>(2));
    EXPECT_EQ(history[0].content, "bbbb");
    EXPECT_EQ(history[1].content, "cccc");
    EXPECT_TRUE(estimator.estimate(contents_of(history)).value <= limits.token_limit);

    store.add_message("t", Role::kAssistant, std::string(15, 'x'));
    EXPECT_EQ(store.size("t"), static_cast<std::size_t>(0));
    EXPECT_TRUE(store.get_history("t").empty());

    store.add_message("t", Role::kUser, "fits");
    EXPECT_EQ(store.size("t"), static_cast<std::size_t>(1));
  }

  // Eviction report separates the three passes.
  {
    TimePoint now = TimePoint{} + std::chrono::hours(1);
    TokenEstimator estimator;
    EvictionLimits limits;
    limits.max_age = std::chrono::minutes(10);
    limits.max_messages = 3;
    limits.token_limit = 4;
    EvictionPolicy policy(limits, estimator);

    std::vector<ConversationRecord> log;
    log.push_back(ConversationRecord{"p", Role::kUser, "stale", now - std::chrono::minutes(30)});
    for (const char* text : {"a", "b", "c", "dd", "ee"}) {
      log.push_back(ConversationRecord{"p", Role::kUser, text, now});
    }
    const EvictionReport report = policy.apply(log, now);
    EXPECT_EQ(report.by_age, static_cast<std::size_t>(1));
    EXPECT_EQ(report.by_count, static_cast<std::size_t>(2));
    EXPECT_EQ(report.by_tokens, static_cast<std::size_t>(1));
    EXPECT_EQ(log.size(), static_cast<std::size_t>(2));
    EXPECT_EQ(log[0].content, "dd");
    EXPECT_EQ(log[1].content, "ee");
  }

  // Clearing one channel leaves the others alone.
  {
    TokenEstimator estimator;
    ConversationStore store(roomy_limits(), estimator);
    store.add_message("5", Role::kUser, "five");
    store.add_message("6", Role::kUser, "six");

    store.clear("5");
    EXPECT_TRUE(store.get_history("5").empty());
    EXPECT_EQ(store.size("6"), static_cast<std::size_t>(1));

    store.clear("7");
    EXPECT_EQ(store.size("6"), static_cast<std::size_t>(1));
    EXPECT_EQ(store.channel_count(), static_cast<std::size_t>(2));

    store.add_message("5", Role::kAssistant, "again");
    EXPECT_EQ(store.size("5"), static_cast<std::size_t>(1));

    store.clear();
    EXPECT_TRUE(store.get_history("5").empty());
    EXPECT_TRUE(store.get_history("6").empty());
    EXPECT_TRUE(store.get_history("unknown").empty());
  }

  // Counter failure falls back to the character count.
  {
    FailingCounter counter;
    TokenEstimator estimator(&counter);
    const uint64_t before = metrics().get("tokens.fallback");
    const TokenEstimate est = estimator.estimate({"ab", "cde"});
    EXPECT_EQ(est.value, static_cast<std::size_t>(5));
    EXPECT_TRUE(!est.precise());
    EXPECT_EQ(metrics().get("tokens.fallback"), before + 1);

    const TokenEstimate japanese = estimator.estimate({"こんにちは"});
    EXPECT_EQ(japanese.value, static_cast<std::size_t>(5));
    EXPECT_EQ(TokenEstimator::heuristic({"ab", "日本", "é"}), static_cast<std::size_t>(5));
  }

  // Precise path, and empty input never reaches the counter.
  {
    FixedCounter fixed(42);
    TokenEstimator precise(&fixed);
    const TokenEstimate est = precise.estimate({"anything"});
    EXPECT_EQ(est.value, static_cast<std::size_t>(42));
    EXPECT_TRUE(est.precise());

    SumCounter counter;
    TokenEstimator estimator(&counter);
    EXPECT_EQ(estimator.estimate({}).value, static_cast<std::size_t>(0));
    EXPECT_EQ(counter.calls, 0);

    FixedCounter negative(-3);
    TokenEstimator guarded(&negative);
    EXPECT_EQ(guarded.estimate({"abc"}).value, static_cast<std::size_t>(3));
    EXPECT_TRUE(!guarded.estimate({"abc"}).precise());
  }

  // Appends keep insertion order and map the caller's role labels.
  {
    TokenEstimator estimator;
    ConversationStore store(roomy_limits(), estimator);
    store.add_message("o", "user", "zeta");
    store.add_message("o", "assistant", "alpha");
    store.add_message("o", "model", "mid");
    store.add_message("o", "system", "beta");
    const auto history = store.get_history("o");
    EXPECT_EQ(history.size(), static_cast<std::size_t>(4));
    EXPECT_TRUE((history[0] == ChatTurn{Role::kUser, "zeta"}));
    EXPECT_TRUE((history[1] == ChatTurn{Role::kAssistant, "alpha"}));
    EXPECT_TRUE((history[2] == ChatTurn{Role::kAssistant, "mid"}));
    EXPECT_TRUE((history[3] == ChatTurn{Role::kUser, "beta"}));

    EXPECT_TRUE(role_from_label(" Assistant ") == Role::kAssistant);
    EXPECT_TRUE(role_from_author(true) == Role::kAssistant);
    EXPECT_TRUE(role_from_author(false) == Role::kUser);
    EXPECT_EQ(std::string(role_wire_label(Role::kAssistant)), "model");
  }

  // Short-term history comes first, fetched history is reversed and kept verbatim.
  {
    TokenEstimator estimator;
    ConversationStore store(roomy_limits(), estimator);
    store.add_message("42", Role::kUser, "A");
    store.add_message("42", Role::kAssistant, "B");

    FakeHistory history;
    history.messages = {{true, "D"}, {false, "C"}};
    ContextAssembler assembler;
    const auto context = assembler.build("42", store, &history);
    EXPECT_EQ(history.last_channel, "42");
    EXPECT_EQ(history.last_limit, static_cast<std::size_t>(5));
    EXPECT_EQ(context.size(), static_cast<std::size_t>(4));
    EXPECT_TRUE((context[0] == ChatTurn{Role::kUser, "A"}));
    EXPECT_TRUE((context[1] == ChatTurn{Role::kAssistant, "B"}));
    EXPECT_TRUE((context[2] == ChatTurn{Role::kUser, "C"}));
    EXPECT_TRUE((context[3] == ChatTurn{Role::kAssistant, "D"}));

    history.messages = {{true, "B"}, {false, "A"}};
    const auto duplicated = assembler.build("42", store, &history);
    EXPECT_EQ(duplicated.size(), static_cast<std::size_t>(4));
    EXPECT_TRUE(duplicated[0] == duplicated[2]);
    EXPECT_TRUE(duplicated[1] == duplicated[3]);

    EXPECT_EQ(assembler.build("42", store, nullptr).size(), static_cast<std::size_t>(2));
  }

  // Fetched history is capped before empty messages are dropped.
  {
    TokenEstimator estimator;
    ConversationStore store(roomy_limits(), estimator);
    FakeHistory history;
    history.messages = {{false, "m7"}, {true, " m6 "}, {false, "   "}, {false, "m4"},
                        {true, "m3"},  {false, "m2"},  {false, "m1"}};
    ContextAssembler assembler(5);
    const auto context = assembler.build("empty", store, &history);
    EXPECT_EQ(context.size(), static_cast<std::size_t>(4));
    EXPECT_EQ(context[0].content, "m3");
    EXPECT_EQ(context[1].content, "m4");
    EXPECT_EQ(context[2].content, "m6");
    EXPECT_EQ(context[3].content, "m7");
    EXPECT_TRUE(context[0].role == Role::kAssistant);

    ContextAssembler disabled(0);
    EXPECT_TRUE(disabled.build("empty", store, &history).empty());
  }

  // A successful turn records both halves; a failed one records nothing.
  {
    TokenEstimator estimator;
    ConversationStore store(roomy_limits(), estimator);
    FakeBackend backend;
    FakeHistory history;
    history.messages = {{false, "earlier question"}};
    TurnProcessor turns(&store, &backend, &history);

    backend.reply = "  hello there \n";
    const TurnResult ok = turns.process("9", "  hi  ");
    EXPECT_TRUE(ok.ok);
    EXPECT_EQ(ok.reply, "hello there");
    EXPECT_EQ(backend.last_user_text, "hi");
    EXPECT_EQ(backend.last_context.size(), static_cast<std::size_t>(1));
    auto log = store.get_history("9");
    EXPECT_EQ(log.size(), static_cast<std::size_t>(2));
    EXPECT_TRUE((log[0] == ChatTurn{Role::kUser, "hi"}));
    EXPECT_TRUE((log[1] == ChatTurn{Role::kAssistant, "hello there"}));

    backend.fail = true;
    const TurnResult failed = turns.process("9", "again");
    EXPECT_TRUE(!failed.ok);
    EXPECT_EQ(failed.error, "generation failed");
    EXPECT_EQ(store.size("9"), static_cast<std::size_t>(2));

    backend.fail = false;
    history.fail = true;
    const int calls = backend.calls;
    EXPECT_TRUE(!turns.process("9", "third").ok);
    EXPECT_EQ(backend.calls, calls);
    EXPECT_EQ(store.size("9"), static_cast<std::size_t>(2));

    EXPECT_TRUE(!turns.process("9", "   ").ok);
    EXPECT_EQ(backend.calls, calls);
  }

  // Gemini payloads and responses.
  {
    const json payload = build_generate_payload({{Role::kUser, "q"}, {Role::kAssistant, "a"}}, "next");
    EXPECT_EQ(payload["contents"].size(), static_cast<std::size_t>(3));
    EXPECT_EQ(payload["contents"][1]["role"].get<std::string>(), "model");
    EXPECT_EQ(payload["contents"][2]["role"].get<std::string>(), "user");
    EXPECT_EQ(payload["contents"][2]["parts"][0]["text"].get<std::string>(), "next");

    const json count = build_count_tokens_payload({"ab", "cde"});
    EXPECT_EQ(count["contents"].size(), static_cast<std::size_t>(1));
    EXPECT_EQ(count["contents"][0]["role"].get<std::string>(), "user");
    EXPECT_EQ(count["contents"][0]["parts"].size(), static_cast<std::size_t>(2));
    EXPECT_EQ(count["contents"][0]["parts"][1]["text"].get<std::string>(), "cde");

    const HttpResponse failed{0, "", "curl init failed"};
    EXPECT_EQ(failed.status, 0L);
    EXPECT_EQ(failed.error, "curl init failed");
    EXPECT_TRUE(failed.headers.empty());

    EXPECT_EQ(parse_count_tokens_response(R"({"totalTokens": 12})"), 12);
    EXPECT_TRUE(throws_backend_error([] { parse_count_tokens_response("{}"); }));
    EXPECT_TRUE(throws_backend_error([] { parse_count_tokens_response("not json"); }));

    const std::string body =
        R"({"candidates":[{"content":{"role":"model","parts":[{"text":"Hel"},{"text":"lo"}]},"finishReason":"STOP"}]})";
    EXPECT_EQ(parse_generate_response(body), "Hello");
    EXPECT_TRUE(throws_backend_error([] { parse_generate_response(R"({"promptFeedback":{"blockReason":"SAFETY"}})"); }));
    EXPECT_TRUE(throws_backend_error([] { parse_generate_response(R"({"candidates":[{"finishReason":"SAFETY"}]})"); }));
    EXPECT_EQ(gemini_error_message(R"({"error":{"code":429,"message":"Resource exhausted"}})"), "Resource exhausted");

    GeminiProvider keyless("", "", "");
    EXPECT_EQ(keyless.model(), "gemini-1.5-flash");
    EXPECT_TRUE(throws_backend_error([&] { keyless.count({"x"}); }));
    TokenEstimator estimator(&keyless);
    EXPECT_EQ(estimator.estimate({"abc"}).value, static_cast<std::size_t>(3));
  }

  // Discord message parsing.
  {
    const std::string body = R"([
      {"id":"3","content":"  thanks <@111>!  ","author":{"id":"111","bot":true},
       "mentions":[{"id":"111","username":"tanki","global_name":null}]},
      {"id":"2","content":"hey <@!222>","author":{"id":"222"},
       "mentions":[{"id":"222","username":"sato","global_name":"Sato"}]},
      "junk",
      {"id":"1","content":"","author":{"id":"333","bot":false}}
    ])";
    const auto messages = parse_discord_messages(body);
    EXPECT_EQ(messages.size(), static_cast<std::size_t>(3));
    EXPECT_TRUE(messages[0].author_is_bot);
    EXPECT_EQ(messages[0].text, "thanks @tanki!");
    EXPECT_TRUE(!messages[1].author_is_bot);
    EXPECT_EQ(messages[1].text, "hey @Sato");
    EXPECT_EQ(messages[2].text, "");
    EXPECT_TRUE(throws_backend_error([] { parse_discord_messages(R"({"message":"Unknown Channel"})"); }));

    DiscordConfig cfg;
    DiscordHistorySource source(cfg);
    EXPECT_TRUE(throws_backend_error([&] { source.fetch_recent("1", 5); }));
  }

  // Config overrides, env references and defaults.
  {
    json root = default_config_json();
    root["memory"]["maxAgeMinutes"] = 30;
    root["memory"]["maxMessages"] = 8;
    root["memory"]["historyFetchLimit"] = 3;
    root["gemini"]["model"] = "gemini-1.5-pro";
    root["discord"]["channelId"] = 1234567890123ULL;
#ifndef _WIN32
    setenv("TANKI_TEST_GEMINI_KEY", "g-test", 1);
    root["gemini"]["apiKey"] = "${TANKI_TEST_GEMINI_KEY}";
#else
    root["gemini"]["apiKey"] = "g-test";
#endif

    const fs::path tmp = fs::temp_directory_path() /
                         ("tanki_test_cfg_" + std::to_string(Clock::now().time_since_epoch().count()) + ".json");
    EXPECT_TRUE(write_text_file(tmp, root.dump(2)));
    const Config cfg = load_config(tmp);
    std::error_code ec;
    fs::remove(tmp, ec);

    EXPECT_EQ(cfg.memory.max_age_minutes, 30);
    EXPECT_EQ(cfg.memory.max_messages, 8);
    EXPECT_EQ(cfg.memory.token_limit, 7168);
    EXPECT_EQ(cfg.memory.history_fetch_limit, 3);
    EXPECT_EQ(cfg.gemini.model, "gemini-1.5-pro");
    EXPECT_EQ(cfg.gemini.api_key, "g-test");
    EXPECT_EQ(cfg.discord.channel_id, "1234567890123");

    const EvictionLimits limits = cfg.memory.eviction_limits();
    EXPECT_EQ(limits.max_age.count(), 30);
    EXPECT_EQ(limits.max_messages, static_cast<std::size_t>(8));

    const Config defaults = load_config(fs::temp_directory_path() / "tanki_missing_config.json");
    EXPECT_EQ(defaults.memory.max_age_minutes, 10);
    EXPECT_EQ(defaults.memory.max_messages, 20);
    EXPECT_EQ(defaults.memory.token_limit, 7168);
    EXPECT_EQ(defaults.memory.history_fetch_limit, 5);
    EXPECT_EQ(defaults.gemini.model, "gemini-1.5-flash");
  }

  std::cout << "OK\n";
  return 0;
}
