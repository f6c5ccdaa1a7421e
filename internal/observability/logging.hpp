#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace ainp::runtime::config {
class RuntimeConfig;
}

namespace ainp::observability {

/*
  Structured logging over spdlog.

  A record is the message followed by key=value pairs; values containing
  whitespace, quotes or '=' are double-quoted so reasons and error texts
  stay one token.
*/

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField UIntField(std::string_view key, std::uint64_t value);
LogField DoubleField(std::string_view key, double value);
LogField BoolField(std::string_view key, bool value);

// Throws std::invalid_argument for names spdlog does not know.
spdlog::level::level_enum ParseLevel(const std::string& name);

void InitializeLogging(const ainp::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

} // namespace ainp::observability

#define AINP_LOG_DEBUG(message, ...) ::ainp::observability::Log(::spdlog::level::debug, (message), ##__VA_ARGS__)
#define AINP_LOG_INFO(message, ...) ::ainp::observability::Log(::spdlog::level::info, (message), ##__VA_ARGS__)
#define AINP_LOG_WARN(message, ...) ::ainp::observability::Log(::spdlog::level::warn, (message), ##__VA_ARGS__)
#define AINP_LOG_ERROR(message, ...) ::ainp::observability::Log(::spdlog::level::err, (message), ##__VA_ARGS__)
