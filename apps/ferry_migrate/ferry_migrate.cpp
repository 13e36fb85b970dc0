// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "config_parser.hpp"
#include "ferry_log_init.hpp"
#include "migration_planner.hpp"
#include "s3_storage_client.hpp"
#include "transfer_ledger.hpp"

#define FERRY_LOG_COMPONENT "ferry_migrate"
#include "ferry_log_macros.hpp"

namespace ferry {

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitFatal = 2;
constexpr int kExitPartial = 3;

// Planner instance for signal handling
std::atomic<migration::MigrationPlanner*> g_planner{nullptr};

void signal_handler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    if (auto* planner = g_planner.load()) {
      planner->requestStop();
    }
  }
}

// Publishes the stop target to the signal handler for the lifetime of the
// scope and restores default handling on every exit path
class StopSignalScope {
public:
  explicit StopSignalScope(migration::MigrationPlanner* target) {
    g_planner.store(target);
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
  }

  ~StopSignalScope() {
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    g_planner.store(nullptr);
  }

  StopSignalScope(const StopSignalScope&) = delete;
  StopSignalScope& operator=(const StopSignalScope&) = delete;
};

void print_usage(const char* program_name) {
  std::cout
    << "Usage: " << program_name << " [OPTIONS]\n"
    << "\n"
    << "Copy every bucket and object from a source endpoint to a destination endpoint.\n"
    << "Objects already present at the destination are skipped, so re-running resumes.\n"
    << "\n"
    << "Options:\n"
    << "  --config PATH              Path to YAML configuration file\n"
    << "  --source-region REGION     Source region (env: OLD_AWS_REGION)\n"
    << "  --source-endpoint URL      Source endpoint URL (env: OLD_AWS_ENDPOINT_URL)\n"
    << "  --source-credentials PATH  Source credentials file (default: .old.credentials)\n"
    << "  --dest-region REGION       Destination region (env: NEW_AWS_REGION)\n"
    << "  --dest-endpoint URL        Destination endpoint URL (env: NEW_AWS_ENDPOINT_URL)\n"
    << "  --dest-credentials PATH    Destination credentials file (default: .new.credentials)\n"
    << "  --suffix SUFFIX            Bucket name suffix on conflict (env: NEW_BUCKET_SUFFIX)\n"
    << "  --bucket NAME              Migrate only this bucket (can be used multiple times)\n"
    << "  --ledger PATH              SQLite transfer ledger (empty disables)\n"
    << "  --max-parts N              Concurrent part uploads per object (default: 8)\n"
    << "  --stop-on-object-failure   Skip a bucket's remaining objects after a failure\n"
    << "  --skip-conflicting-buckets Record bucket naming errors and continue\n"
    << "  --log-level LEVEL          Console log level (debug, info, warn, error)\n"
    << "  --help                     Show this help message\n"
    << "\n"
    << "Precedence: command line > environment > config file > defaults.\n"
    << "\n"
    << "Exit codes:\n"
    << "  0  all buckets migrated\n"
    << "  1  configuration or usage error\n"
    << "  2  fatal migration error (listing, bucket naming)\n"
    << "  3  finished, some objects or buckets failed\n"
    << std::endl;
}

void print_summary(const migration::MigrationSummary& summary, const migration::MigrationStats& stats) {
  std::cout << "\n=== Migration Summary ===\n";
  for (const auto& report : summary.buckets) {
    std::cout << "  " << report.source_bucket;
    if (!report.destination_bucket.empty() && report.destination_bucket != report.source_bucket) {
      std::cout << " -> " << report.destination_bucket;
    }
    std::cout << ": " << migration::bucketStatusToString(report.status) << " ("
              << report.transferred << "/" << report.pending << " transferred, "
              << report.already_migrated << " already present";
    if (!report.failed_keys.empty()) {
      std::cout << ", " << report.failed_keys.size() << " failed";
    }
    if (report.listing_truncated) {
      std::cout << ", listing capped";
    }
    std::cout << ")";
    if (!report.error.empty()) {
      std::cout << " - " << report.error;
    }
    std::cout << "\n";
  }
  std::cout << "Objects transferred: " << stats.objects_transferred.load() << "\n"
            << "Objects skipped:     " << stats.objects_skipped.load() << "\n"
            << "Objects failed:      " << stats.objects_failed.load() << "\n"
            << "Bytes transferred:   " << stats.bytes_transferred.load() << "\n"
            << "Sessions recovered:  " << summary.sessions_recovered << "\n";
  if (summary.stopped) {
    std::cout << "Stopped before completion; re-run to resume.\n";
  }
  std::cout << std::endl;
}

}  // namespace

}  // namespace ferry

int main(int argc, char* argv[]) {
  using namespace ferry;

  for (int i = 1; i < argc; ++i) {
    if (strcmp(argv[i], "--help") == 0 || strcmp(argv[i], "-h") == 0) {
      print_usage(argv[0]);
      return kExitOk;
    }
  }

  // Step 1: Parse command line
  std::string config_file;
  std::string cli_source_region;
  std::string cli_source_endpoint;
  std::string cli_source_credentials;
  std::string cli_dest_region;
  std::string cli_dest_endpoint;
  std::string cli_dest_credentials;
  std::string cli_suffix;
  bool cli_suffix_set = false;
  std::string cli_ledger;
  bool cli_ledger_set = false;
  std::string cli_log_level;
  int cli_max_parts = 0;
  bool cli_stop_on_object_failure = false;
  bool cli_skip_conflicting = false;
  std::vector<std::string> cli_buckets;

  auto take_value = [&](int& i, const char* flag, std::string& out) {
    if (i + 1 < argc) {
      out = argv[++i];
      return true;
    }
    std::cerr << "Error: " << flag << " requires an argument" << std::endl;
    return false;
  };

  for (int i = 1; i < argc; ++i) {
    std::string value;
    if (strcmp(argv[i], "--config") == 0) {
      if (!take_value(i, "--config", config_file)) return kExitUsage;
    } else if (strcmp(argv[i], "--source-region") == 0) {
      if (!take_value(i, "--source-region", cli_source_region)) return kExitUsage;
    } else if (strcmp(argv[i], "--source-endpoint") == 0) {
      if (!take_value(i, "--source-endpoint", cli_source_endpoint)) return kExitUsage;
    } else if (strcmp(argv[i], "--source-credentials") == 0) {
      if (!take_value(i, "--source-credentials", cli_source_credentials)) return kExitUsage;
    } else if (strcmp(argv[i], "--dest-region") == 0) {
      if (!take_value(i, "--dest-region", cli_dest_region)) return kExitUsage;
    } else if (strcmp(argv[i], "--dest-endpoint") == 0) {
      if (!take_value(i, "--dest-endpoint", cli_dest_endpoint)) return kExitUsage;
    } else if (strcmp(argv[i], "--dest-credentials") == 0) {
      if (!take_value(i, "--dest-credentials", cli_dest_credentials)) return kExitUsage;
    } else if (strcmp(argv[i], "--suffix") == 0) {
      if (!take_value(i, "--suffix", cli_suffix)) return kExitUsage;
      cli_suffix_set = true;
    } else if (strcmp(argv[i], "--bucket") == 0) {
      if (!take_value(i, "--bucket", value)) return kExitUsage;
      cli_buckets.push_back(value);
    } else if (strcmp(argv[i], "--ledger") == 0) {
      if (!take_value(i, "--ledger", cli_ledger)) return kExitUsage;
      cli_ledger_set = true;
    } else if (strcmp(argv[i], "--max-parts") == 0) {
      if (!take_value(i, "--max-parts", value)) return kExitUsage;
      cli_max_parts = std::atoi(value.c_str());
      if (cli_max_parts <= 0) {
        std::cerr << "Error: --max-parts must be a positive number" << std::endl;
        return kExitUsage;
      }
    } else if (strcmp(argv[i], "--log-level") == 0) {
      if (!take_value(i, "--log-level", cli_log_level)) return kExitUsage;
    } else if (strcmp(argv[i], "--stop-on-object-failure") == 0) {
      cli_stop_on_object_failure = true;
    } else if (strcmp(argv[i], "--skip-conflicting-buckets") == 0) {
      cli_skip_conflicting = true;
    } else {
      std::cerr << "Error: Unknown argument: " << argv[i] << std::endl;
      print_usage(argv[0]);
      return kExitUsage;
    }
  }

  // Step 2: Config file, then environment
  config::FerryConfig cfg;
  config::ConfigParser parser;
  if (!config_file.empty() && !parser.load_from_file(config_file, cfg)) {
    std::cerr << "Error: Failed to load config file '" << config_file
              << "': " << parser.get_last_error() << std::endl;
    return kExitUsage;
  }
  config::ConfigParser::apply_environment(cfg);

  // Step 3: Command line overrides
  if (!cli_source_region.empty()) cfg.source.region = cli_source_region;
  if (!cli_source_endpoint.empty()) cfg.source.endpoint_url = cli_source_endpoint;
  if (!cli_source_credentials.empty()) cfg.source.credentials_file = cli_source_credentials;
  if (!cli_dest_region.empty()) cfg.destination.region = cli_dest_region;
  if (!cli_dest_endpoint.empty()) cfg.destination.endpoint_url = cli_dest_endpoint;
  if (!cli_dest_credentials.empty()) cfg.destination.credentials_file = cli_dest_credentials;
  if (cli_suffix_set) cfg.migration.bucket_suffix = cli_suffix;
  if (cli_ledger_set) cfg.ledger_path = cli_ledger;
  if (cli_max_parts > 0) cfg.transfer.max_concurrent_parts = cli_max_parts;
  if (cli_stop_on_object_failure) cfg.migration.continue_on_object_failure = false;
  if (cli_skip_conflicting) cfg.migration.halt_on_bucket_conflict = false;
  if (!cli_buckets.empty()) cfg.migration.only_buckets = cli_buckets;
  if (!cli_log_level.empty()) {
    auto level = logging::parse_severity_level(cli_log_level);
    if (!level) {
      std::cerr << "Error: Invalid --log-level: " << cli_log_level << std::endl;
      return kExitUsage;
    }
    cfg.logging.console_level = *level;
  }

  std::string error;
  if (!config::ConfigParser::validate(cfg, error)) {
    std::cerr << "Error: Invalid configuration: " << error << std::endl;
    return kExitUsage;
  }

  cfg.logging.tool_name = "ferry_migrate";
  logging::init_logging(cfg.logging);

  FERRY_LOG_INFO(
    "ferry_migrate starting" << logging::kv("run", logging::current_run_id())
                             << logging::kv("source_region", cfg.source.region)
                             << logging::kv("source_endpoint", cfg.source.endpoint_url)
                             << logging::kv("dest_region", cfg.destination.region)
                             << logging::kv("dest_endpoint", cfg.destination.endpoint_url)
                             << logging::kv("suffix", cfg.migration.bucket_suffix)
  );

  int exit_code = kExitOk;
  try {
    storage::S3StorageClient source(cfg.source);
    storage::S3StorageClient destination(cfg.destination);

    std::unique_ptr<migration::TransferLedger> ledger;
    if (!cfg.ledger_path.empty()) {
      ledger = std::make_unique<migration::TransferLedger>(cfg.ledger_path);
    }

    migration::MigrationPlanner planner(
      source, destination, cfg.migration, cfg.transfer, ledger.get()
    );
    StopSignalScope stop_signals(&planner);

    try {
      auto summary = planner.run();
      print_summary(summary, planner.stats());
      if (summary.hasFailures() || summary.stopped) {
        exit_code = kExitPartial;
      }
    } catch (const migration::MigrationError& e) {
      FERRY_LOG_FATAL(
        "Migration halted: " << e.what()
                             << logging::kv("kind", migration::migrationErrorKindToString(e.kind()))
                             << logging::kv("bucket", e.bucket())
      );
      std::cerr << "Error: " << e.what() << std::endl;
      exit_code = kExitFatal;
    }

  } catch (const std::runtime_error& e) {
    // Client credentials or ledger could not be set up
    FERRY_LOG_FATAL("Startup failed: " << e.what());
    std::cerr << "Error: " << e.what() << std::endl;
    exit_code = kExitUsage;
  } catch (const std::exception& e) {
    FERRY_LOG_FATAL("Unexpected error: " << e.what());
    std::cerr << "Error: " << e.what() << std::endl;
    exit_code = kExitFatal;
  }

  logging::shutdown_logging();
  return exit_code;
}
