#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace claims::runtime::config {
class RuntimeConfig;
}

namespace claims::observability {

// Rendered as key=value after the message.
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField CountField(std::string_view key, std::uint64_t value);
LogField BoolField(std::string_view key, bool value);

// Level and pattern: CLAIMS_LOG_LEVEL / CLAIMS_LOG_PATTERN, then the logging section, then defaults.
void InitializeLogging(const claims::runtime::config::RuntimeConfig& config);
// Environment only; used before a config is loaded.
void InitializeDefaultLogging();
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

} // namespace claims::observability

#define CLAIMS_LOG_DEBUG(message, ...) ::claims::observability::Log(::spdlog::level::debug, (message), ##__VA_ARGS__)
#define CLAIMS_LOG_INFO(message, ...) ::claims::observability::Log(::spdlog::level::info, (message), ##__VA_ARGS__)
#define CLAIMS_LOG_WARN(message, ...) ::claims::observability::Log(::spdlog::level::warn, (message), ##__VA_ARGS__)
#define CLAIMS_LOG_ERROR(message, ...) ::claims::observability::Log(::spdlog::level::err, (message), ##__VA_ARGS__)
