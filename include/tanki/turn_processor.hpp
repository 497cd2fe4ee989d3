#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "tanki/common.hpp"
#include "tanki/context_assembler.hpp"
#include "tanki/conversation_store.hpp"
#include "tanki/metrics.hpp"
#include "tanki/provider.hpp"

namespace tanki {

struct TurnResult {
  bool ok{false};
  std::string reply;
  std::string error;
};

// Runs one inbound turn: assemble context, generate, then record both halves.
// Turns on the same channel are serialized; a failed turn leaves the store untouched.
class TurnProcessor {
 public:
  TurnProcessor(ConversationStore* store, GenerationBackend* backend, HistorySource* history,
                ContextAssembler assembler = ContextAssembler{})
      : store_(store), backend_(backend), history_(history), assembler_(assembler) {}

  TurnResult process(const std::string& channel_id, const std::string& text) {
    TurnResult out;
    const std::string user_text = trim(text);
    if (user_text.empty()) {
      out.error = "empty message";
      return out;
    }
    if (!store_ || !backend_) {
      out.error = "turn processor is not configured";
      return out;
    }

    std::lock_guard<std::mutex> channel_lock(channel_mutex(channel_id));

    try {
      const std::vector<ChatTurn> context = assembler_.build(channel_id, *store_, history_);
      Logger::log(Logger::Level::kDebug,
                  "Channel " + channel_id + ": generating with " + std::to_string(context.size()) + " context turn(s)");
      out.reply = trim(backend_->generate(context, user_text));
    } catch (const std::exception& e) {
      Logger::log(Logger::Level::kError, "Turn failed for channel " + channel_id + ": " + e.what());
      metrics().inc("turns.error");
      out.reply.clear();
      out.error = e.what();
      return out;
    }

    store_->add_exchange(channel_id, user_text, out.reply);
    metrics().inc("turns.ok");
    out.ok = true;
    return out;
  }

 private:
  std::mutex& channel_mutex(const std::string& channel_id) {
    std::lock_guard<std::mutex> lock(locks_mu_);
    auto& slot = channel_locks_[channel_id];
    if (!slot) {
      slot = std::make_unique<std::mutex>();
    }
    return *slot;
  }

  ConversationStore* store_{nullptr};
  GenerationBackend* backend_{nullptr};
  HistorySource* history_{nullptr};
  ContextAssembler assembler_;

  std::mutex locks_mu_;
  std::unordered_map<std::string, std::unique_ptr<std::mutex>> channel_locks_;
};

}  // namespace tanki
