#include "internal/observability/logging.hpp"

#include <cstdio>
#include <cstdlib>
#include <sstream>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace outflow::observability {
namespace {

constexpr const char* kLoggerName = "outflow";

std::string ResolveLevel(const outflow::runtime::config::RuntimeConfig& config) {
  if (const char* level = std::getenv("OUTFLOW_LOG_LEVEL")) {
    return level;
  }

  if (!config.logging().level().empty()) {
    return config.logging().level();
  }

  return "info";
}

std::string ResolvePattern(const outflow::runtime::config::RuntimeConfig& config) {
  if (const char* pattern = std::getenv("OUTFLOW_LOG_PATTERN")) {
    return pattern;
  }

  if (!config.logging().pattern().empty()) {
    return config.logging().pattern();
  }

  return "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";
}

std::string SerializeFields(std::initializer_list<LogField> fields) {
  std::ostringstream out;
  bool first = true;
  for (const auto& field : fields) {
    if (!first) {
      out << ' ';
    }
    first = false;
    out << field.key << '=';
    // free-text values (notes, error messages) are quoted to keep fields splittable
    if (field.value.find(' ') != std::string::npos) {
      out << '"' << field.value << '"';
    } else {
      out << field.value;
    }
  }
  return out.str();
}

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

LogField MoneyField(std::string_view key, model::Money paise) {
  const bool         negative = paise < 0;
  const std::int64_t abs      = negative ? -paise : paise;
  char               buf[32];
  std::snprintf(buf, sizeof(buf), "%s%lld.%02lld", negative ? "-" : "", static_cast<long long>(abs / 100), static_cast<long long>(abs % 100));
  return {std::string(key), buf};
}

LogField KeyField(const model::LevelKey& key) {
  return {"stock_key", key.ToString()};
}

// Logs go to stderr so CLI output on stdout stays machine readable.
void InitializeLogging(const outflow::runtime::config::RuntimeConfig& config) {
  auto logger = spdlog::get(kLoggerName);
  if (!logger) {
    logger = spdlog::stderr_color_mt(kLoggerName);
  }
  logger->set_pattern(ResolvePattern(config));
  logger->set_level(spdlog::level::from_str(ResolveLevel(config)));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto serialized_fields = SerializeFields(fields);

  if (!serialized_fields.empty()) {
    spdlog::log(level, "{} {}", message, serialized_fields);
    return;
  }
  spdlog::log(level, "{}", message);
}

} // namespace outflow::observability
