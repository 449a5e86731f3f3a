#include "server/logging/logger.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <iostream>
#include <mutex>

using json = nlohmann::json;

namespace chatwarden {
namespace log {

namespace {

std::atomic<bool> g_json_mode{false};
std::atomic<int> g_min_level{static_cast<int>(Level::INFO)};
std::mutex g_mutex;

bool Enabled(Level level) {
  return static_cast<int>(level) >= g_min_level.load();
}

void Write(Level level, const std::string &component,
           const std::string &message, const json *fields,
           const std::string &extra) {
  if (!Enabled(level)) {
    return;
  }
  auto now = std::chrono::system_clock::now();
  auto ts = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch())
                .count();

  std::string line;
  if (g_json_mode.load()) {
    json j;
    j["ts"] = ts;
    j["level"] = LevelName(level);
    j["component"] = component;
    j["message"] = message;
    if (fields && !fields->empty()) {
      j["fields"] = *fields;
    }
    if (!extra.empty()) {
      j["extra"] = extra;
    }
    line = j.dump(-1, ' ', false, json::error_handler_t::replace);
  } else {
    line = std::string("[") + LevelName(level) + "] " + component + ": " +
           message;
    if (fields && !fields->empty()) {
      line += " | " + fields->dump(-1, ' ', false, json::error_handler_t::replace);
    }
    if (!extra.empty()) {
      line += " | " + extra;
    }
  }

  std::lock_guard<std::mutex> lock(g_mutex);
  std::cerr << line << "\n";
}

} // namespace

void SetJsonMode(bool enabled) { g_json_mode.store(enabled); }
bool IsJsonMode() { return g_json_mode.load(); }

void SetMinLevel(Level level) { g_min_level.store(static_cast<int>(level)); }
Level MinLevel() { return static_cast<Level>(g_min_level.load()); }

bool ParseLevel(const std::string &text, Level *level) {
  std::string lowered = text;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lowered == "debug") {
    *level = Level::DEBUG;
  } else if (lowered == "info") {
    *level = Level::INFO;
  } else if (lowered == "warn" || lowered == "warning") {
    *level = Level::WARN;
  } else if (lowered == "error") {
    *level = Level::ERROR;
  } else {
    return false;
  }
  return true;
}

const char *LevelName(Level level) {
  switch (level) {
  case Level::DEBUG:
    return "DEBUG";
  case Level::INFO:
    return "INFO";
  case Level::WARN:
    return "WARN";
  case Level::ERROR:
    return "ERROR";
  }
  return "UNKNOWN";
}

void Log(Level level, const std::string &component, const std::string &message,
         const std::string &extra) {
  Write(level, component, message, nullptr, extra);
}

std::string Excerpt(const std::string &text, std::size_t limit) {
  if (text.size() <= limit) {
    return text;
  }
  return text.substr(0, limit) + "...";
}

void StderrEventLog::Emit(Level level, const std::string &component,
                          const std::string &event, const json &fields) {
  Write(level, component, event, &fields, {});
}

} // namespace log
} // namespace chatwarden
