#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <stdexcept>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace dockyard::observability {
namespace {

constexpr const char* kLoggerName     = "dockyard";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

// environment first, then the config file
std::string Setting(const char* env, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(env); value != nullptr && *value != '\0') return value;
  return configured.empty() ? fallback : configured;
}

spdlog::level::level_enum ParseLevel(const std::string& name) {
  const auto level = spdlog::level::from_str(name);
  // from_str maps anything it does not know to off
  if (level == spdlog::level::off && name != "off") {
    throw std::invalid_argument("unknown log level: " + name);
  }
  return level;
}

bool NeedsQuoting(const std::string& value) {
  return value.empty() || value.find_first_of(" \t\"=") != std::string::npos;
}

void AppendField(std::string& out, const LogField& field) {
  out += ' ';
  out += field.key;
  out += '=';
  if (!NeedsQuoting(field.value)) {
    out += field.value;
    return;
  }
  out += '"';
  for (char c : field.value) {
    if (c == '"' || c == '\\') out += '\\';
    out += c;
  }
  out += '"';
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

void InitializeLogging(const dockyard::runtime::config::RuntimeConfig& config) {
  const auto level   = ParseLevel(Setting("DOCKYARD_LOG_LEVEL", config.logging().level(), "info"));
  const auto pattern = Setting("DOCKYARD_LOG_PATTERN", config.logging().pattern(), kDefaultPattern);

  // stdout carries command output, so logs go to stderr
  auto logger = spdlog::get(kLoggerName);
  if (!logger) logger = spdlog::stderr_color_mt(kLoggerName);

  logger->set_pattern(pattern);
  logger->set_level(level);
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(std::move(logger));
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) return;

  std::string line(message);
  for (const auto& field : fields) AppendField(line, field);
  spdlog::log(level, "{}", line);
}

} // namespace dockyard::observability
