#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace sitemap::runtime::config {
class RuntimeConfig;
}

namespace sitemap::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);

void InitializeLogging(const sitemap::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace sitemap::observability

#define SITEMAP_LOG_INFO(message, ...) ::sitemap::observability::LogInfo((message), ##__VA_ARGS__)
#define SITEMAP_LOG_ERROR(message, ...) ::sitemap::observability::LogError((message), ##__VA_ARGS__)
