#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>

namespace chatwarden {
namespace log {

enum class Level { DEBUG, INFO, WARN, ERROR };

// Enable JSON-structured output (one JSON object per line to stderr).
// Default mode is plain text: "[LEVEL] component: message".
// Call from main() based on logging.format / CHATWARDEN_LOG_FORMAT=json before
// any logging.
void SetJsonMode(bool enabled);
bool IsJsonMode();

// Entries below `level` are dropped. Default is INFO.
void SetMinLevel(Level level);
Level MinLevel();

// Accepts debug|info|warn|warning|error (any case).
bool ParseLevel(const std::string &text, Level *level);
const char *LevelName(Level level);

// Emit a log entry at the given level.  `component` identifies the subsystem
// (e.g. "gateway", "relay", "sanitizer").  `extra` is an optional key=value
// string appended to the JSON object or the text line (ignored when empty).
void Log(Level level, const std::string &component, const std::string &message,
         const std::string &extra = {});

// Convenience wrappers.
inline void Debug(const std::string &component, const std::string &message,
                  const std::string &extra = {}) {
  Log(Level::DEBUG, component, message, extra);
}
inline void Info(const std::string &component, const std::string &message,
                 const std::string &extra = {}) {
  Log(Level::INFO, component, message, extra);
}
inline void Warn(const std::string &component, const std::string &message,
                 const std::string &extra = {}) {
  Log(Level::WARN, component, message, extra);
}
inline void Error(const std::string &component, const std::string &message,
                  const std::string &extra = {}) {
  Log(Level::ERROR, component, message, extra);
}

// First `limit` characters of `text`, with "..." appended when cut. Used for
// content excerpts in moderation events.
std::string Excerpt(const std::string &text, std::size_t limit = 50);

// Per-request event sink handed to the moderation pipeline. `fields` is a JSON
// object; callers always include "request_id".
class EventLog {
public:
  virtual ~EventLog() = default;
  virtual void Emit(Level level, const std::string &component,
                    const std::string &event,
                    const nlohmann::json &fields) = 0;
};

// Writes events through Log(): fields become a nested "fields" object in JSON
// mode and a " | {...}" suffix in text mode.
class StderrEventLog : public EventLog {
public:
  void Emit(Level level, const std::string &component,
            const std::string &event, const nlohmann::json &fields) override;
};

} // namespace log
} // namespace chatwarden
