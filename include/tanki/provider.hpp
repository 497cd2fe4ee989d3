#pragma once

#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include "tanki/common.hpp"
#include "tanki/conversation.hpp"
#include "tanki/http.hpp"
#include "tanki/token_estimator.hpp"

namespace tanki {

// Failure of an external service (transport, HTTP status, or malformed response).
class BackendError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class GenerationBackend {
 public:
  virtual ~GenerationBackend() = default;

  // Returns the reply to `user_text` given the prior context. Throws on failure.
  virtual std::string generate(const std::vector<ChatTurn>& context, const std::string& user_text) = 0;
};

inline json gemini_content(Role role, const std::string& text) {
  return json{{"role", role_wire_label(role)}, {"parts", json::array({json{{"text", text}}})}};
}

inline json build_count_tokens_payload(const std::vector<std::string>& texts) {
  json parts = json::array();
  for (const auto& t : texts) {
    parts.push_back(json{{"text", t}});
  }
  return json{{"contents", json::array({json{{"role", "user"}, {"parts", parts}}})}};
}

inline json build_generate_payload(const std::vector<ChatTurn>& context, const std::string& user_text) {
  json contents = json::array();
  for (const auto& turn : context) {
    contents.push_back(gemini_content(turn.role, turn.content));
  }
  contents.push_back(gemini_content(Role::kUser, user_text));
  return json{{"contents", contents}};
}

inline std::string gemini_error_message(const std::string& body) {
  try {
    const json data = json::parse(body);
    if (data.contains("error") && data["error"].is_object()) {
      return data["error"].value("message", "");
    }
  } catch (const json::exception&) {
  }
  return "";
}

inline int parse_count_tokens_response(const std::string& body) {
  json data;
  try {
    data = json::parse(body);
  } catch (const json::exception& e) {
    throw BackendError(std::string("malformed countTokens response: ") + e.what());
  }
  if (!data.is_object() || !data.contains("totalTokens") || !data["totalTokens"].is_number_integer()) {
    throw BackendError("countTokens response has no totalTokens");
  }
  return data["totalTokens"].get<int>();
}

inline std::string parse_generate_response(const std::string& body) {
  json data;
  try {
    data = json::parse(body);
  } catch (const json::exception& e) {
    throw BackendError(std::string("malformed generateContent response: ") + e.what());
  }

  if (!data.is_object() || !data.contains("candidates") || !data["candidates"].is_array() ||
      data["candidates"].empty()) {
    std::string reason = "no candidates";
    if (data.is_object() && data.contains("promptFeedback") && data["promptFeedback"].is_object()) {
      const std::string block = data["promptFeedback"].value("blockReason", "");
      if (!block.empty()) {
        reason = "prompt blocked: " + block;
      }
    }
    throw BackendError("generateContent returned " + reason);
  }

  const json& candidate = data["candidates"][0];
  if (!candidate.contains("content") || !candidate["content"].is_object() ||
      !candidate["content"].contains("parts") || !candidate["content"]["parts"].is_array()) {
    const std::string finish = candidate.value("finishReason", "");
    throw BackendError("generateContent candidate has no content" +
                       (finish.empty() ? std::string() : " (finishReason " + finish + ")"));
  }

  std::string text;
  for (const auto& part : candidate["content"]["parts"]) {
    if (part.is_object() && part.contains("text") && part["text"].is_string()) {
      text += part["text"].get<std::string>();
    }
  }
  return text;
}

// Gemini REST API: generateContent for replies, countTokens for the estimator.
class GeminiProvider : public GenerationBackend, public TokenCounter {
 public:
  GeminiProvider(std::string api_key, std::string api_base, std::string model, int count_timeout_s = 15,
                 int generate_timeout_s = 90)
      : api_key_(std::move(api_key)),
        api_base_(std::move(api_base)),
        model_(std::move(model)),
        count_timeout_s_(count_timeout_s),
        generate_timeout_s_(generate_timeout_s) {
    if (api_base_.empty()) {
      api_base_ = "https://generativelanguage.googleapis.com/v1beta";
    }
    while (!api_base_.empty() && api_base_.back() == '/') {
      api_base_.pop_back();
    }
    if (model_.empty()) {
      model_ = "gemini-1.5-flash";
    }
  }

  const std::string& model() const { return model_; }

  int count(const std::vector<std::string>& texts) override {
    const HttpResponse resp = call("countTokens", build_count_tokens_payload(texts), count_timeout_s_);
    return parse_count_tokens_response(resp.body);
  }

  std::string generate(const std::vector<ChatTurn>& context, const std::string& user_text) override {
    const HttpResponse resp =
        call("generateContent", build_generate_payload(context, user_text), generate_timeout_s_);
    return parse_generate_response(resp.body);
  }

 private:
  HttpResponse call(const std::string& method, const json& payload, int timeout_s) {
    if (api_key_.empty()) {
      throw BackendError("no Gemini API key configured");
    }

    const std::map<std::string, std::string> headers = {
        {"x-goog-api-key", api_key_},
        {"Content-Type", "application/json"},
    };

    thread_local HttpClient client;
    HttpResponse resp =
        client.post(api_base_ + "/models/" + model_ + ":" + method, payload.dump(), headers, timeout_s);

    if (!resp.error.empty()) {
      throw BackendError("Gemini " + method + " failed: " + resp.error);
    }
    if (resp.status < 200 || resp.status >= 300) {
      const std::string detail = gemini_error_message(resp.body);
      throw BackendError("Gemini " + method + " failed (HTTP " + std::to_string(resp.status) + ")" +
                         (detail.empty() ? std::string() : ": " + detail));
    }
    return resp;
  }

  std::string api_key_;
  std::string api_base_;
  std::string model_;
  int count_timeout_s_;
  int generate_timeout_s_;
};

}  // namespace tanki
