// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "config_parser.hpp"

#include <chrono>
#include <cstdlib>
#include <fstream>

#define FERRY_LOG_COMPONENT "config_parser"
#include "ferry_log_macros.hpp"

namespace ferry {
namespace config {

namespace {

void override_from_env(const char* name, std::string& target) {
  if (const char* value = std::getenv(name)) {
    target = value;
  }
}

bool validate_endpoint(const char* role, const storage::S3Config& endpoint, std::string& error_msg) {
  if (!is_valid_region(endpoint.region)) {
    error_msg = std::string(role) + " region is invalid: '" + endpoint.region + "'";
    return false;
  }
  if (!endpoint.endpoint_url.empty() && endpoint.endpoint_url.find("://") == std::string::npos) {
    error_msg = std::string(role) + " endpoint_url must include a scheme: " + endpoint.endpoint_url;
    return false;
  }
  if (endpoint.access_key.empty() != endpoint.secret_key.empty()) {
    error_msg = std::string(role) + " access_key and secret_key must be set together";
    return false;
  }
  if (endpoint.connect_timeout_ms <= 0 || endpoint.request_timeout_ms <= 0) {
    error_msg = std::string(role) + " timeouts must be > 0";
    return false;
  }
  if (endpoint.retry.max_retries < 0) {
    error_msg = std::string(role) + " retry.max_retries must be >= 0";
    return false;
  }
  return true;
}

}  // namespace

bool is_valid_region(const std::string& region) {
  if (region.empty()) {
    return false;
  }
  for (char c : region) {
    const bool allowed = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-';
    if (!allowed) {
      return false;
    }
  }
  return true;
}

// ============================================================================
// ConfigParser Implementation
// ============================================================================

bool ConfigParser::load_from_file(const std::string& path, FerryConfig& config) {
  std::ifstream file(path);
  if (!file.good()) {
    last_error_ = "Config file not found or not readable: " + path;
    return false;
  }

  try {
    YAML::Node yaml = YAML::LoadFile(path);
    return load_from_string(YAML::Dump(yaml), config);
  } catch (const YAML::Exception& e) {
    last_error_ = "Failed to parse YAML file: " + std::string(e.what());
    FERRY_LOG_ERROR("Failed to parse config" << ::ferry::logging::kv("path", path));
    return false;
  }
}

bool ConfigParser::load_from_string(const std::string& yaml_content, FerryConfig& config) {
  try {
    YAML::Node node = YAML::Load(yaml_content);

    if (node["source"] && !parse_endpoint(node["source"], config.source)) {
      return false;
    }
    if (node["destination"] && !parse_endpoint(node["destination"], config.destination)) {
      return false;
    }
    if (node["migration"] && !parse_migration(node["migration"], config)) {
      return false;
    }
    if (node["sweep"] && !parse_sweep(node["sweep"], config)) {
      return false;
    }
    if (node["logging"] && !parse_logging(node["logging"], config.logging)) {
      return false;
    }

    return true;
  } catch (const YAML::Exception& e) {
    last_error_ = "Failed to parse YAML content: " + std::string(e.what());
    FERRY_LOG_ERROR("Failed to parse config" << ::ferry::logging::kv("error", std::string(e.what())));
    return false;
  }
}

bool ConfigParser::parse_endpoint(const YAML::Node& node, storage::S3Config& endpoint) {
  if (node["region"]) {
    endpoint.region = node["region"].as<std::string>();
  }
  if (node["endpoint_url"]) {
    endpoint.endpoint_url = node["endpoint_url"].as<std::string>();
  }
  if (node["credentials_file"]) {
    endpoint.credentials_file = node["credentials_file"].as<std::string>();
  }
  if (node["profile"]) {
    endpoint.profile = node["profile"].as<std::string>();
  }
  if (node["access_key"]) {
    endpoint.access_key = node["access_key"].as<std::string>();
  }
  if (node["secret_key"]) {
    endpoint.secret_key = node["secret_key"].as<std::string>();
  }
  if (node["use_ssl"]) {
    endpoint.use_ssl = node["use_ssl"].as<bool>();
  }
  if (node["verify_ssl"]) {
    endpoint.verify_ssl = node["verify_ssl"].as<bool>();
  }
  if (node["connect_timeout_ms"]) {
    endpoint.connect_timeout_ms = node["connect_timeout_ms"].as<int>();
  }
  if (node["request_timeout_ms"]) {
    endpoint.request_timeout_ms = node["request_timeout_ms"].as<int>();
  }
  if (node["max_connections"]) {
    endpoint.max_connections = node["max_connections"].as<int>();
  }

  if (node["retry"]) {
    const auto& retry = node["retry"];
    if (retry["max_retries"]) {
      endpoint.retry.max_retries = retry["max_retries"].as<int>();
    }
    if (retry["initial_delay_ms"]) {
      endpoint.retry.initial_delay = std::chrono::milliseconds(retry["initial_delay_ms"].as<int>());
    }
    if (retry["max_delay_ms"]) {
      endpoint.retry.max_delay = std::chrono::milliseconds(retry["max_delay_ms"].as<int>());
    }
    if (retry["exponential_base"]) {
      endpoint.retry.exponential_base = retry["exponential_base"].as<double>();
    }
    if (retry["jitter"]) {
      endpoint.retry.jitter = retry["jitter"].as<bool>();
    }
  }

  return true;
}

bool ConfigParser::parse_migration(const YAML::Node& node, FerryConfig& config) {
  if (node["bucket_suffix"]) {
    config.migration.bucket_suffix = node["bucket_suffix"].as<std::string>();
  }
  if (node["continue_on_object_failure"]) {
    config.migration.continue_on_object_failure = node["continue_on_object_failure"].as<bool>();
  }
  if (node["halt_on_bucket_conflict"]) {
    config.migration.halt_on_bucket_conflict = node["halt_on_bucket_conflict"].as<bool>();
  }
  if (node["max_concurrent_parts"]) {
    config.transfer.max_concurrent_parts = node["max_concurrent_parts"].as<int>();
  }
  if (node["page_size"]) {
    config.migration.page_size = node["page_size"].as<int>();
  }
  if (node["ledger_path"]) {
    config.ledger_path = node["ledger_path"].as<std::string>();
  }
  if (node["buckets"]) {
    config.migration.only_buckets = node["buckets"].as<std::vector<std::string>>();
  }
  return true;
}

bool ConfigParser::parse_sweep(const YAML::Node& node, FerryConfig& config) {
  if (node["target"]) {
    const auto target = node["target"].as<std::string>();
    if (target == "source") {
      config.sweep_target = SweepTarget::SOURCE;
    } else if (target == "destination") {
      config.sweep_target = SweepTarget::DESTINATION;
    } else {
      last_error_ = "sweep.target must be 'source' or 'destination', got '" + target + "'";
      return false;
    }
  }
  if (node["dry_run"]) {
    config.sweep.dry_run = node["dry_run"].as<bool>();
  }
  if (node["page_size"]) {
    config.sweep.page_size = node["page_size"].as<int>();
  }
  if (node["buckets"]) {
    config.sweep.only_buckets = node["buckets"].as<std::vector<std::string>>();
  }
  return true;
}

bool ConfigParser::parse_logging(const YAML::Node& node, logging::LoggingConfig& logging) {
  if (node["console"]) {
    const auto& console = node["console"];
    if (console["enabled"]) {
      logging.console_enabled = console["enabled"].as<bool>();
    }
    if (console["colors"]) {
      logging.console_colors = console["colors"].as<bool>();
    }
    if (console["level"]) {
      auto level = logging::parse_severity_level(console["level"].as<std::string>());
      if (!level) {
        last_error_ = "Invalid logging.console.level: " + console["level"].as<std::string>();
        return false;
      }
      logging.console_level = *level;
    }
  }

  if (node["file"]) {
    const auto& file = node["file"];
    if (file["enabled"]) {
      logging.file_enabled = file["enabled"].as<bool>();
    }
    if (file["level"]) {
      auto level = logging::parse_severity_level(file["level"].as<std::string>());
      if (!level) {
        last_error_ = "Invalid logging.file.level: " + file["level"].as<std::string>();
        return false;
      }
      logging.file_level = *level;
    }
    if (file["directory"]) {
      logging.file_config.directory = file["directory"].as<std::string>();
    }
    if (file["pattern"]) {
      logging.file_config.file_pattern = file["pattern"].as<std::string>();
    }
    if (file["format"]) {
      logging.file_config.format_json = file["format"].as<std::string>() == "json";
    }
    if (file["rotation_size_mb"]) {
      logging.file_config.rotation_size_mb = file["rotation_size_mb"].as<uint64_t>();
    }
    if (file["max_files"]) {
      logging.file_config.max_files = file["max_files"].as<int>();
    }
    if (file["rotate_at_midnight"]) {
      logging.file_config.rotate_at_midnight = file["rotate_at_midnight"].as<bool>();
    }
  }

  return true;
}

void ConfigParser::apply_environment(FerryConfig& config) {
  override_from_env("OLD_AWS_REGION", config.source.region);
  override_from_env("OLD_AWS_ENDPOINT_URL", config.source.endpoint_url);
  override_from_env("NEW_AWS_REGION", config.destination.region);
  override_from_env("NEW_AWS_ENDPOINT_URL", config.destination.endpoint_url);
  override_from_env("NEW_BUCKET_SUFFIX", config.migration.bucket_suffix);
  logging::apply_env_overrides(config.logging);
}

bool ConfigParser::validate(const FerryConfig& config, std::string& error_msg) {
  if (!validate_endpoint("source", config.source, error_msg)) {
    return false;
  }
  if (!validate_endpoint("destination", config.destination, error_msg)) {
    return false;
  }

  if (config.transfer.max_concurrent_parts < 1) {
    error_msg = "migration.max_concurrent_parts must be > 0";
    return false;
  }
  if (config.transfer.chunk_size < storage::kChunkSize) {
    error_msg = "chunk size below the 5 MiB multipart minimum";
    return false;
  }
  if (config.migration.page_size < 0 || config.sweep.page_size < 0) {
    error_msg = "page_size must be >= 0";
    return false;
  }
  // Suffixed names must stay valid bucket names
  if (config.migration.bucket_suffix.find_first_not_of("abcdefghijklmnopqrstuvwxyz0123456789-.") !=
      std::string::npos) {
    error_msg = "migration.bucket_suffix may only contain lowercase letters, digits, '-' and '.'";
    return false;
  }
  if (config.logging.file_enabled && config.logging.file_config.directory.empty()) {
    error_msg = "logging.file.directory is empty";
    return false;
  }
  if (config.logging.file_enabled && config.logging.file_config.max_files < 1) {
    error_msg = "logging.file.max_files must be > 0";
    return false;
  }

  return true;
}

}  // namespace config
}  // namespace ferry
