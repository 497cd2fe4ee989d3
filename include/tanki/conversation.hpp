#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "tanki/common.hpp"

namespace tanki {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

enum class Role { kUser, kAssistant };

// Caller vocabulary: "assistant" and the backend's "model" are the assistant,
// everything else is treated as the user.
inline Role role_from_label(const std::string& label) {
  const std::string l = to_lower(trim(label));
  return (l == "assistant" || l == "model") ? Role::kAssistant : Role::kUser;
}

inline Role role_from_author(bool author_is_bot) { return author_is_bot ? Role::kAssistant : Role::kUser; }

// Label expected by the generation backend.
inline const char* role_wire_label(Role role) { return role == Role::kAssistant ? "model" : "user"; }

struct ConversationRecord {
  std::string channel_id;
  Role role{Role::kUser};
  std::string content;
  TimePoint timestamp{};
};

struct ChatTurn {
  Role role{Role::kUser};
  std::string content;

  bool operator==(const ChatTurn&) const = default;
};

// A message as reported by the messaging platform.
struct PlatformMessage {
  bool author_is_bot{false};
  std::string text;
};

// Works for both ConversationRecord and ChatTurn sequences.
template <typename Entry>
std::vector<std::string> contents_of(const std::vector<Entry>& entries) {
  std::vector<std::string> out;
  out.reserve(entries.size());
  for (const auto& e : entries) {
    out.push_back(e.content);
  }
  return out;
}

}  // namespace tanki
