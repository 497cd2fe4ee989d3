#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "tanki/common.hpp"
#include "tanki/conversation.hpp"
#include "tanki/conversation_store.hpp"

namespace tanki {

// Live channel history from the messaging platform.
class HistorySource {
 public:
  virtual ~HistorySource() = default;

  // At most `limit` messages, newest first. Throws on failure.
  virtual std::vector<PlatformMessage> fetch_recent(const std::string& channel_id, std::size_t limit) = 0;
};

class ContextAssembler {
 public:
  static constexpr std::size_t kDefaultHistoryFetchLimit = 5;

  explicit ContextAssembler(std::size_t history_fetch_limit = kDefaultHistoryFetchLimit)
      : history_fetch_limit_(history_fetch_limit) {}

  // Short-term history followed by fetched platform history, both oldest first.
  // The two segments are not deduplicated against each other.
  std::vector<ChatTurn> build(const std::string& channel_id, const ConversationStore& store,
                              HistorySource* history) const {
    std::vector<ChatTurn> out = store.get_history(channel_id);
    if (!history || history_fetch_limit_ == 0) {
      return out;
    }

    std::vector<PlatformMessage> recent = history->fetch_recent(channel_id, history_fetch_limit_);
    if (recent.size() > history_fetch_limit_) {
      recent.resize(history_fetch_limit_);
    }

    std::vector<ChatTurn> fetched;
    fetched.reserve(recent.size());
    for (const auto& m : recent) {
      std::string text = trim(m.text);
      if (text.empty()) {
        continue;
      }
      fetched.push_back(ChatTurn{role_from_author(m.author_is_bot), std::move(text)});
    }

    out.insert(out.end(), fetched.rbegin(), fetched.rend());
    return out;
  }

 private:
  std::size_t history_fetch_limit_;
};

}  // namespace tanki
