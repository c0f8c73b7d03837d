#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace tracereplay::runtime::config {
class ReplayConfig;
}

namespace tracereplay::observability {

/*
  Structured diagnostics for the replay tool itself.

      TRACEREPLAY_LOG_WARN("replay worker has exited", {StringField("thread_id", id)});

  renders as `replay worker has exited thread_id=ThreadId(2)`. Values with
  spaces, quotes or `=` are quoted and escaped.

  This is not where replayed events go; those are rendered by the
  dispatch backend.
*/
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField UintField(std::string_view key, std::uint64_t value);
LogField BoolField(std::string_view key, bool value);

// TRACEREPLAY_LOG_LEVEL / TRACEREPLAY_LOG_PATTERN override the config.
// Throws util::InvalidConfig for an unknown level name.
void InitializeLogging(const tracereplay::runtime::config::ReplayConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogDebug(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::debug, message, fields);
}

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace tracereplay::observability

#define TRACEREPLAY_LOG_DEBUG(message, ...) ::tracereplay::observability::LogDebug((message), ##__VA_ARGS__)
#define TRACEREPLAY_LOG_INFO(message, ...) ::tracereplay::observability::LogInfo((message), ##__VA_ARGS__)
#define TRACEREPLAY_LOG_WARN(message, ...) ::tracereplay::observability::LogWarn((message), ##__VA_ARGS__)
#define TRACEREPLAY_LOG_ERROR(message, ...) ::tracereplay::observability::LogError((message), ##__VA_ARGS__)
