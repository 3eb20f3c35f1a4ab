#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace tender::runtime::config {
class RuntimeConfig;
}

namespace tender::observability {

/*
  One key=value pair appended to a log line. Values containing spaces,
  quotes or '=' are written quoted so lines stay machine-splittable.
*/
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// tender_id=<id>
LogField TenderField(std::uint64_t tender_id);
// caller=<identity>, "-" for an anonymous caller.
LogField CallerField(std::string_view caller);

// Throws std::runtime_error on an unknown level name.
void InitializeLogging(const tender::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

std::string FormatLine(std::string_view message, std::initializer_list<LogField> fields);

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

} // namespace tender::observability

#define TENDER_LOG_DEBUG(message, ...) ::tender::observability::LogDebug((message), ##__VA_ARGS__)
#define TENDER_LOG_INFO(message, ...) ::tender::observability::LogInfo((message), ##__VA_ARGS__)
#define TENDER_LOG_WARN(message, ...) ::tender::observability::LogWarn((message), ##__VA_ARGS__)
#define TENDER_LOG_ERROR(message, ...) ::tender::observability::LogError((message), ##__VA_ARGS__)
