// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_CONFIG_PARSER_HPP
#define FERRY_CONFIG_PARSER_HPP

#include <yaml-cpp/yaml.h>

#include <string>

#include "bucket_sweeper.hpp"
#include "chunked_transfer_engine.hpp"
#include "ferry_log_init.hpp"
#include "migration_planner.hpp"
#include "s3_storage_client.hpp"

namespace ferry {
namespace config {

enum class SweepTarget { SOURCE, DESTINATION };

/**
 * Complete configuration of the ferry executables
 */
struct FerryConfig {
  storage::S3Config source;
  storage::S3Config destination;

  migration::MigrationOptions migration;
  storage::ChunkedTransferConfig transfer;
  std::string ledger_path;  // Empty disables the ledger

  migration::SweepOptions sweep;
  SweepTarget sweep_target = SweepTarget::SOURCE;

  logging::LoggingConfig logging;

  FerryConfig() {
    source.credentials_file = ".old.credentials";
    destination.credentials_file = ".new.credentials";
  }
};

/**
 * Check a region string
 *
 * Any non-empty string of lowercase letters, digits and dashes passes;
 * the provider rejects regions it does not serve.
 */
bool is_valid_region(const std::string& region);

class ConfigParser {
public:
  ConfigParser() = default;

  /**
   * Load configuration from YAML file
   */
  bool load_from_file(const std::string& path, FerryConfig& config);

  /**
   * Load configuration from YAML string
   */
  bool load_from_string(const std::string& yaml_content, FerryConfig& config);

  /**
   * Apply environment overrides
   *
   *   OLD_AWS_REGION, OLD_AWS_ENDPOINT_URL  - source endpoint
   *   NEW_AWS_REGION, NEW_AWS_ENDPOINT_URL  - destination endpoint
   *   NEW_BUCKET_SUFFIX                     - destination bucket suffix
   *   FERRY_LOG_*                           - see logging::apply_env_overrides
   */
  static void apply_environment(FerryConfig& config);

  /**
   * Validate configuration
   */
  static bool validate(const FerryConfig& config, std::string& error_msg);

  /**
   * Get last error message
   */
  std::string get_last_error() const {
    return last_error_;
  }

private:
  bool parse_endpoint(const YAML::Node& node, storage::S3Config& endpoint);
  bool parse_migration(const YAML::Node& node, FerryConfig& config);
  bool parse_sweep(const YAML::Node& node, FerryConfig& config);
  bool parse_logging(const YAML::Node& node, logging::LoggingConfig& logging);

  mutable std::string last_error_;
};

}  // namespace config
}  // namespace ferry

#endif  // FERRY_CONFIG_PARSER_HPP
