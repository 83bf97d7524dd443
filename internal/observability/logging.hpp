#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace workledger::runtime::config {
class RuntimeConfig;
}

namespace workledger::observability {

/*
  Structured logging on top of spdlog.

  Messages are a fixed event string followed by key=value fields, e.g.

    job claimed job_id=... type=image_generation attempts=1
*/

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// Installs the "workledger" logger as spdlog's default. Safe to call again
// (the level and pattern are re-applied).
void InitializeLogging(const workledger::runtime::config::RuntimeConfig& config);
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

} // namespace workledger::observability

#define WORKLEDGER_LOG_DEBUG(message, ...) ::workledger::observability::LogDebug((message), ##__VA_ARGS__)
#define WORKLEDGER_LOG_INFO(message, ...) ::workledger::observability::LogInfo((message), ##__VA_ARGS__)
#define WORKLEDGER_LOG_WARN(message, ...) ::workledger::observability::LogWarn((message), ##__VA_ARGS__)
#define WORKLEDGER_LOG_ERROR(message, ...) ::workledger::observability::LogError((message), ##__VA_ARGS__)
