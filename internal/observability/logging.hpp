#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

#include "internal/model/inventory.hpp"
#include "internal/model/types.hpp"

namespace outflow::runtime::config {
class RuntimeConfig;
}

namespace outflow::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// Renders paise as rupees with two decimals, e.g. 133930 -> "1339.30".
LogField MoneyField(std::string_view key, model::Money paise);

// "stock_key=<part>@<store>"
LogField KeyField(const model::LevelKey& key);

void InitializeLogging(const outflow::runtime::config::RuntimeConfig& config);
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

} // namespace outflow::observability

#define OUTFLOW_LOG_DEBUG(message, ...) ::outflow::observability::LogDebug((message), ##__VA_ARGS__)
#define OUTFLOW_LOG_INFO(message, ...) ::outflow::observability::LogInfo((message), ##__VA_ARGS__)
#define OUTFLOW_LOG_WARN(message, ...) ::outflow::observability::LogWarn((message), ##__VA_ARGS__)
#define OUTFLOW_LOG_ERROR(message, ...) ::outflow::observability::LogError((message), ##__VA_ARGS__)
