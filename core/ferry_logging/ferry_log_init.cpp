// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "ferry_log_init.hpp"

#include <boost/log/attributes/constant.hpp>
#include <boost/log/attributes/attribute_set.hpp>
#include <boost/log/core.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>

#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <ctime>
#include <mutex>
#include <vector>

#include "ferry_log_format.hpp"
#include "ferry_log_macros.hpp"

namespace ferry {
namespace logging {

namespace {

std::mutex g_sinks_mutex;
boost::shared_ptr<async_console_sink_t> g_console_sink;
boost::shared_ptr<async_file_sink_t> g_file_sink;
std::string g_run_id;
std::vector<boost::log::attribute_set::iterator> g_run_attributes;
bool g_initialized = false;

std::string to_lower(std::string str) {
  std::transform(str.begin(), str.end(), str.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return str;
}

std::optional<std::string> get_env(const char* name) {
  const char* value = std::getenv(name);
  if (value == nullptr || value[0] == '\0') {
    return std::nullopt;
  }
  return std::string(value);
}

std::optional<bool> parse_bool(const std::string& str) {
  const std::string lower = to_lower(str);
  if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") {
    return true;
  }
  if (lower == "false" || lower == "0" || lower == "no" || lower == "off") {
    return false;
  }
  return std::nullopt;
}

void set_level_from_env(const char* name, severity_level& level) {
  if (auto value = get_env(name)) {
    if (auto parsed = parse_severity_level(*value)) {
      level = *parsed;
    }
  }
}

void set_flag_from_env(const char* name, bool& flag) {
  if (auto value = get_env(name)) {
    if (auto parsed = parse_bool(*value)) {
      flag = *parsed;
    }
  }
}

// stop() drains the async queue before the sink is detached
template <typename Sink>
void detach_sink(boost::shared_ptr<Sink>& sink) {
  if (!sink) {
    return;
  }
  sink->stop();
  sink->flush();
  boost::log::core::get()->remove_sink(sink);
  sink.reset();
}

}  // namespace

std::optional<severity_level> parse_severity_level(const std::string& level_str) {
  const std::string lower = to_lower(level_str);
  if (lower == "debug") return severity_level::debug;
  if (lower == "info") return severity_level::info;
  if (lower == "warn" || lower == "warning") return severity_level::warn;
  if (lower == "error") return severity_level::error;
  if (lower == "fatal") return severity_level::fatal;
  return std::nullopt;
}

void apply_env_overrides(LoggingConfig& config) {
  if (auto value = get_env("FERRY_LOG_LEVEL")) {
    if (auto level = parse_severity_level(*value)) {
      config.console_level = *level;
      config.file_level = *level;
    }
  }
  // Sink-specific levels win over the global one
  set_level_from_env("FERRY_LOG_CONSOLE_LEVEL", config.console_level);
  set_level_from_env("FERRY_LOG_FILE_LEVEL", config.file_level);

  set_flag_from_env("FERRY_LOG_FILE_ENABLED", config.file_enabled);
  set_flag_from_env("FERRY_LOG_COLORS", config.console_colors);

  if (auto dir = get_env("FERRY_LOG_FILE_DIR")) {
    config.file_config.directory = *dir;
  }
  if (auto format = get_env("FERRY_LOG_FORMAT")) {
    config.file_config.format_json = (to_lower(*format) == "json");
  }
  if (auto run_id = get_env("FERRY_LOG_RUN_ID")) {
    config.run_id = *run_id;
  }
}

std::string make_run_id(const std::string& tool_name) {
  std::time_t now = std::time(nullptr);
  std::tm utc{};
  gmtime_r(&now, &utc);
  char stamp[32];
  std::strftime(stamp, sizeof(stamp), "%Y%m%dT%H%M%S", &utc);
  return (tool_name.empty() ? std::string("ferry") : tool_name) + "-" + stamp + "-" +
         std::to_string(static_cast<long>(getpid()));
}

logger_type& get_logger() {
  static logger_type instance;
  return instance;
}

void init_logging(const LoggingConfig& config) {
  std::lock_guard<std::mutex> lock(g_sinks_mutex);
  if (g_initialized) {
    return;
  }

  auto core = boost::log::core::get();
  boost::log::add_common_attributes();

  g_run_id = config.run_id.empty() ? make_run_id(config.tool_name) : config.run_id;
  auto tool = core->add_global_attribute(
    kAttrTool, boost::log::attributes::constant<std::string>(config.tool_name)
  );
  auto run = core->add_global_attribute(
    kAttrRunId, boost::log::attributes::constant<std::string>(g_run_id)
  );
  for (const auto& added : {tool, run}) {
    if (added.second) {
      g_run_attributes.push_back(added.first);
    }
  }

  if (config.console_enabled) {
    g_console_sink = create_console_sink(config.console_level, config.console_colors);
    core->add_sink(g_console_sink);
  }
  if (config.file_enabled) {
    g_file_sink = create_file_sink(config.file_config, config.file_level, config.tool_name);
    core->add_sink(g_file_sink);
  }

  g_initialized = true;
}

void init_logging_default() {
  init_logging(LoggingConfig());
}

void shutdown_logging() {
  std::lock_guard<std::mutex> lock(g_sinks_mutex);
  if (!g_initialized) {
    return;
  }

  detach_sink(g_console_sink);
  detach_sink(g_file_sink);

  auto core = boost::log::core::get();
  for (auto it : g_run_attributes) {
    core->remove_global_attribute(it);
  }
  g_run_attributes.clear();
  g_run_id.clear();
  g_initialized = false;
}

void flush_logging() {
  std::lock_guard<std::mutex> lock(g_sinks_mutex);
  if (g_console_sink) g_console_sink->flush();
  if (g_file_sink) g_file_sink->flush();
}

bool is_logging_initialized() {
  std::lock_guard<std::mutex> lock(g_sinks_mutex);
  return g_initialized;
}

std::string current_run_id() {
  std::lock_guard<std::mutex> lock(g_sinks_mutex);
  return g_run_id;
}

}  // namespace logging
}  // namespace ferry
