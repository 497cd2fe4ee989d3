#pragma once

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace tanki {

using json = nlohmann::json;
namespace fs = std::filesystem;

inline std::string trim(const std::string& s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    return "";
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(start, end - start + 1);
}

inline std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

inline std::string home_dir() {
#ifdef _WIN32
  const char* p = std::getenv("USERPROFILE");
#else
  const char* p = std::getenv("HOME");
#endif
  return p ? std::string(p) : std::string(".");
}

inline fs::path expand_user_path(const std::string& p) {
  if (!p.empty() && p[0] == '~') {
    std::string suffix = p.substr(1);
    while (!suffix.empty() && (suffix.front() == '/' || suffix.front() == '\\')) {
      suffix.erase(suffix.begin());
    }
    return fs::path(home_dir()) / suffix;
  }
  return fs::path(p);
}

inline std::string read_text_file(const fs::path& p) {
  std::ifstream in(p, std::ios::in | std::ios::binary);
  if (!in) {
    return "";
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

inline bool write_text_file(const fs::path& p, const std::string& content) {
  std::error_code ec;
  fs::create_directories(p.parent_path(), ec);
  std::ofstream out(p, std::ios::out | std::ios::binary | std::ios::trunc);
  if (!out) {
    return false;
  }
  out << content;
  return true;
}

inline std::string now_iso8601() {
  const auto now = std::chrono::system_clock::now();
  const auto t = std::chrono::system_clock::to_time_t(now);
  std::tm tm{};
#ifdef _WIN32
  localtime_s(&tm, &t);
#else
  localtime_r(&t, &tm);
#endif
  std::ostringstream ss;
  ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
  return ss.str();
}

class Logger {
 public:
  enum class Level { kInfo, kWarn, kError, kDebug };

  static void set_json(bool enabled) { json_mode().store(enabled); }
  static void set_min_level(Level level) { min_level().store(level); }

  static void log(Level level, const std::string& msg) {
    if (level_rank(level) < level_rank(min_level().load())) {
      return;
    }
    static std::mutex mu;
    std::lock_guard<std::mutex> lock(mu);
    if (json_mode().load()) {
      json j;
      j["time"] = now_iso8601();
      j["level"] = level_name(level);
      j["msg"] = msg;
      std::cerr << j.dump() << "\n";
    } else {
      std::cerr << "[" << level_name(level) << "] " << msg << "\n";
    }
  }

  static Level parse_level(const std::string& name, Level fallback) {
    const std::string n = to_lower(trim(name));
    if (n == "debug") {
      return Level::kDebug;
    }
    if (n == "info") {
      return Level::kInfo;
    }
    if (n == "warn" || n == "warning") {
      return Level::kWarn;
    }
    if (n == "error") {
      return Level::kError;
    }
    return fallback;
  }

 private:
  static int level_rank(Level level) {
    switch (level) {
      case Level::kDebug:
        return 0;
      case Level::kInfo:
        return 1;
      case Level::kWarn:
        return 2;
      case Level::kError:
      default:
        return 3;
    }
  }

  static std::atomic<bool>& json_mode() {
    static std::atomic<bool> v{false};
    return v;
  }

  static std::atomic<Level>& min_level() {
    static std::atomic<Level> v{Level::kInfo};
    return v;
  }

  static const char* level_name(Level level) {
    switch (level) {
      case Level::kInfo:
        return "INFO";
      case Level::kWarn:
        return "WARN";
      case Level::kError:
        return "ERROR";
      case Level::kDebug:
      default:
        return "DEBUG";
    }
  }
};

}  // namespace tanki
