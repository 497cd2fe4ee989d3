#pragma once

#include <chrono>
#include <cstddef>
#include <vector>

#include "tanki/conversation.hpp"
#include "tanki/token_estimator.hpp"

namespace tanki {

struct EvictionLimits {
  std::chrono::minutes max_age{10};
  std::size_t max_messages{20};
  std::size_t token_limit{7168};
};

struct EvictionReport {
  std::size_t by_age{0};
  std::size_t by_count{0};
  std::size_t by_tokens{0};

  std::size_t total() const { return by_age + by_count + by_tokens; }
};

// Age filter, then count cap, then token budget. Always drops the oldest records.
class EvictionPolicy {
 public:
  EvictionPolicy(EvictionLimits limits, const TokenEstimator& estimator)
      : limits_(limits), estimator_(estimator) {}

  EvictionReport apply(std::vector<ConversationRecord>& log, TimePoint now) const {
    EvictionReport report;

    const std::size_t before = log.size();
    std::erase_if(log, [&](const ConversationRecord& r) { return now - r.timestamp > limits_.max_age; });
    report.by_age = before - log.size();

    if (log.size() > limits_.max_messages) {
      report.by_count = log.size() - limits_.max_messages;
      log.erase(log.begin(), log.begin() + static_cast<std::ptrdiff_t>(report.by_count));
    }

    while (!log.empty() && estimator_.estimate(contents_of(log)).value > limits_.token_limit) {
      log.erase(log.begin());
      ++report.by_tokens;
    }

    return report;
  }

 private:
  EvictionLimits limits_;
  const TokenEstimator& estimator_;
};

}  // namespace tanki
