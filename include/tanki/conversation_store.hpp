#pragma once

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "tanki/common.hpp"
#include "tanki/conversation.hpp"
#include "tanki/eviction.hpp"
#include "tanki/metrics.hpp"
#include "tanki/token_estimator.hpp"

namespace tanki {

// Short-term history per channel. Every append is followed by an eviction pass on
// that channel. Each public call is atomic; a read followed by a later append is not.
class ConversationStore {
 public:
  using ClockFn = std::function<TimePoint()>;

  ConversationStore(EvictionLimits limits, const TokenEstimator& estimator, ClockFn clock = {})
      : policy_(limits, estimator), clock_(clock ? std::move(clock) : ClockFn([] { return Clock::now(); })) {}

  void add_message(const std::string& channel_id, Role role, const std::string& content) {
    std::lock_guard<std::mutex> lock(mu_);
    append_locked(channel_id, role, content);
  }

  void add_message(const std::string& channel_id, const std::string& role, const std::string& content) {
    add_message(channel_id, role_from_label(role), content);
  }

  // Appends a user turn and its reply under one lock so no other call lands between them.
  void add_exchange(const std::string& channel_id, const std::string& user_content,
                    const std::string& assistant_content) {
    std::lock_guard<std::mutex> lock(mu_);
    append_locked(channel_id, Role::kUser, user_content);
    append_locked(channel_id, Role::kAssistant, assistant_content);
  }

  void clear(const std::optional<std::string>& channel_id = std::nullopt) {
    std::lock_guard<std::mutex> lock(mu_);
    if (!channel_id.has_value()) {
      for (auto& kv : logs_) {
        kv.second.clear();
      }
      Logger::log(Logger::Level::kInfo, "Cleared short-term history for all channels");
      return;
    }
    auto it = logs_.find(*channel_id);
    if (it == logs_.end()) {
      return;
    }
    it->second.clear();
    Logger::log(Logger::Level::kInfo, "Cleared short-term history for channel " + *channel_id);
  }

  std::vector<ChatTurn> get_history(const std::string& channel_id) const {
    std::lock_guard<std::mutex> lock(mu_);
    std::vector<ChatTurn> out;
    const auto it = logs_.find(channel_id);
    if (it == logs_.end()) {
      return out;
    }
    out.reserve(it->second.size());
    for (const auto& r : it->second) {
      out.push_back(ChatTurn{r.role, r.content});
    }
    return out;
  }

  std::size_t size(const std::string& channel_id) const {
    std::lock_guard<std::mutex> lock(mu_);
    const auto it = logs_.find(channel_id);
    return it == logs_.end() ? 0 : it->second.size();
  }

  std::size_t channel_count() const {
    std::lock_guard<std::mutex> lock(mu_);
    return logs_.size();
  }

 private:
  void append_locked(const std::string& channel_id, Role role, const std::string& content) {
    auto& log = logs_[channel_id];
    const TimePoint now = clock_();
    // Timestamps stay non-decreasing even if the wall clock steps back.
    const TimePoint stamp = (!log.empty() && now < log.back().timestamp) ? log.back().timestamp : now;
    log.push_back(ConversationRecord{channel_id, role, content, stamp});
    cleanup_locked(channel_id, log, now);
  }

  void cleanup_locked(const std::string& channel_id, std::vector<ConversationRecord>& log, TimePoint now) {
    const EvictionReport report = policy_.apply(log, now);
    if (report.total() == 0) {
      return;
    }
    metrics().inc("evict.age", report.by_age);
    metrics().inc("evict.count", report.by_count);
    metrics().inc("evict.tokens", report.by_tokens);
    Logger::log(Logger::Level::kDebug, "Evicted " + std::to_string(report.total()) + " record(s) from channel " +
                                           channel_id + " (age " + std::to_string(report.by_age) + ", count " +
                                           std::to_string(report.by_count) + ", tokens " +
                                           std::to_string(report.by_tokens) + ")");
  }

  EvictionPolicy policy_;
  ClockFn clock_;
  mutable std::mutex mu_;
  std::unordered_map<std::string, std::vector<ConversationRecord>> logs_;
};

}  // namespace tanki
