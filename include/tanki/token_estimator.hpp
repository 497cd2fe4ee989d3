#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

#include "tanki/common.hpp"
#include "tanki/metrics.hpp"

namespace tanki {

// Precise token counting service. Implementations throw on any failure.
class TokenCounter {
 public:
  virtual ~TokenCounter() = default;

  virtual int count(const std::vector<std::string>& texts) = 0;
};

struct TokenEstimate {
  enum class Source { kPrecise, kHeuristic };

  std::size_t value{0};
  Source source{Source::kPrecise};

  bool precise() const { return source == Source::kPrecise; }
};

class TokenEstimator {
 public:
  explicit TokenEstimator(TokenCounter* counter = nullptr) : counter_(counter) {}

  // Never throws for counter failures; falls back to the character heuristic.
  TokenEstimate estimate(const std::vector<std::string>& texts) const {
    if (texts.empty()) {
      return TokenEstimate{0, TokenEstimate::Source::kPrecise};
    }
    if (!counter_) {
      return TokenEstimate{heuristic(texts), TokenEstimate::Source::kHeuristic};
    }

    try {
      const int n = counter_->count(texts);
      if (n < 0) {
        throw std::runtime_error("negative token count " + std::to_string(n));
      }
      metrics().inc("tokens.precise");
      return TokenEstimate{static_cast<std::size_t>(n), TokenEstimate::Source::kPrecise};
    } catch (const std::exception& e) {
      Logger::log(Logger::Level::kWarn, std::string("Token count failed, using character estimate: ") + e.what());
      metrics().inc("tokens.fallback");
      return TokenEstimate{heuristic(texts), TokenEstimate::Source::kHeuristic};
    }
  }

  // Character count: UTF-8 continuation bytes are not counted.
  static std::size_t heuristic(const std::vector<std::string>& texts) {
    std::size_t total = 0;
    for (const auto& t : texts) {
      for (const char c : t) {
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
          ++total;
        }
      }
    }
    return total;
  }

 private:
  TokenCounter* counter_{nullptr};
};

}  // namespace tanki
