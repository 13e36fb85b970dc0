// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include <atomic>
#include <csignal>
#include <cstring>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include "bucket_sweeper.hpp"
#include "config_parser.hpp"
#include "ferry_log_init.hpp"
#include "s3_storage_client.hpp"

#define FERRY_LOG_COMPONENT "ferry_sweep"
#include "ferry_log_macros.hpp"

namespace ferry {

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitFatal = 2;
constexpr int kExitPartial = 3;

std::atomic<migration::BucketSweeper*> g_sweeper{nullptr};

void signal_handler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    if (auto* sweeper = g_sweeper.load()) {
      sweeper->requestStop();
    }
  }
}

// Publishes the stop target to the signal handler for the lifetime of the
// scope and restores default handling on every exit path
class StopSignalScope {
public:
  explicit StopSignalScope(migration::BucketSweeper* target) {
    g_sweeper.store(target);
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
  }

  ~StopSignalScope() {
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    g_sweeper.store(nullptr);
  }

  StopSignalScope(const StopSignalScope&) = delete;
  StopSignalScope& operator=(const StopSignalScope&) = delete;
};

void print_usage(const char* program_name) {
  std::cout
    << "Usage: " << program_name << " [OPTIONS]\n"
    << "\n"
    << "Delete every object and then every bucket at one endpoint.\n"
    << "This is destructive and cannot be undone; try --dry-run first.\n"
    << "\n"
    << "Options:\n"
    << "  --config PATH          Path to YAML configuration file\n"
    << "  --target WHICH         Endpoint to sweep: source (default) or destination\n"
    << "  --region REGION        Override the target endpoint region\n"
    << "  --endpoint URL         Override the target endpoint URL\n"
    << "  --credentials PATH     Override the target credentials file\n"
    << "  --bucket NAME          Sweep only this bucket (can be used multiple times)\n"
    << "  --dry-run              List what would be deleted, delete nothing\n"
    << "  --log-level LEVEL      Console log level (debug, info, warn, error)\n"
    << "  --help                 Show this help message\n"
    << "\n"
    << "Exit codes:\n"
    << "  0  every bucket removed\n"
    << "  1  configuration or usage error\n"
    << "  2  bucket listing failed\n"
    << "  3  finished, some objects or buckets were kept\n"
    << std::endl;
}

void print_summary(const migration::SweepSummary& summary, bool dry_run) {
  std::cout << "\n=== Sweep Summary" << (dry_run ? " (dry run)" : "") << " ===\n";
  for (const auto& report : summary.buckets) {
    std::cout << "  " << report.bucket << ": " << report.objects_deleted << "/"
              << report.objects_listed << " objects deleted";
    if (report.delete_failures > 0) {
      std::cout << ", " << report.delete_failures << " failed";
    }
    std::cout << (report.bucket_deleted ? ", bucket deleted" : ", bucket kept");
    if (!report.error.empty()) {
      std::cout << " - " << report.error;
    }
    std::cout << "\n";
  }
  if (summary.stopped) {
    std::cout << "Stopped before completion.\n";
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

  std::string config_file;
  std::string cli_target;
  std::string cli_region;
  std::string cli_endpoint;
  std::string cli_credentials;
  std::string cli_log_level;
  std::vector<std::string> cli_buckets;
  bool cli_dry_run = false;

  for (int i = 1; i < argc; ++i) {
    if (strcmp(argv[i], "--dry-run") == 0) {
      cli_dry_run = true;
      continue;
    }

    std::string* dest = nullptr;
    std::string bucket;
    if (strcmp(argv[i], "--config") == 0) {
      dest = &config_file;
    } else if (strcmp(argv[i], "--target") == 0) {
      dest = &cli_target;
    } else if (strcmp(argv[i], "--region") == 0) {
      dest = &cli_region;
    } else if (strcmp(argv[i], "--endpoint") == 0) {
      dest = &cli_endpoint;
    } else if (strcmp(argv[i], "--credentials") == 0) {
      dest = &cli_credentials;
    } else if (strcmp(argv[i], "--log-level") == 0) {
      dest = &cli_log_level;
    } else if (strcmp(argv[i], "--bucket") == 0) {
      dest = &bucket;
    } else {
      std::cerr << "Error: Unknown argument: " << argv[i] << std::endl;
      print_usage(argv[0]);
      return kExitUsage;
    }

    if (i + 1 >= argc) {
      std::cerr << "Error: " << argv[i] << " requires an argument" << std::endl;
      return kExitUsage;
    }
    *dest = argv[++i];
    if (dest == &bucket) {
      cli_buckets.push_back(bucket);
    }
  }

  config::FerryConfig cfg;
  config::ConfigParser parser;
  if (!config_file.empty() && !parser.load_from_file(config_file, cfg)) {
    std::cerr << "Error: Failed to load config file '" << config_file
              << "': " << parser.get_last_error() << std::endl;
    return kExitUsage;
  }
  config::ConfigParser::apply_environment(cfg);

  if (!cli_target.empty()) {
    if (cli_target == "source") {
      cfg.sweep_target = config::SweepTarget::SOURCE;
    } else if (cli_target == "destination") {
      cfg.sweep_target = config::SweepTarget::DESTINATION;
    } else {
      std::cerr << "Error: --target must be 'source' or 'destination'" << std::endl;
      return kExitUsage;
    }
  }

  storage::S3Config& target = cfg.sweep_target == config::SweepTarget::SOURCE
                                ? cfg.source
                                : cfg.destination;
  if (!cli_region.empty()) target.region = cli_region;
  if (!cli_endpoint.empty()) target.endpoint_url = cli_endpoint;
  if (!cli_credentials.empty()) target.credentials_file = cli_credentials;
  if (cli_dry_run) cfg.sweep.dry_run = true;
  if (!cli_buckets.empty()) cfg.sweep.only_buckets = cli_buckets;
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

  cfg.logging.tool_name = "ferry_sweep";
  logging::init_logging(cfg.logging);

  FERRY_LOG_INFO(
    "ferry_sweep starting"
    << logging::kv("run", logging::current_run_id())
    << logging::kv(
         "target", cfg.sweep_target == config::SweepTarget::SOURCE ? "source" : "destination"
       )
    << logging::kv("region", target.region) << logging::kv("endpoint", target.endpoint_url)
    << logging::kv("dry_run", cfg.sweep.dry_run)
  );

  int exit_code = kExitOk;
  try {
    storage::S3StorageClient client(target);
    migration::BucketSweeper sweeper(client, cfg.sweep);
    StopSignalScope stop_signals(&sweeper);

    try {
      auto summary = sweeper.run();
      print_summary(summary, cfg.sweep.dry_run);
      if (summary.hasFailures() || summary.stopped) {
        exit_code = kExitPartial;
      }
    } catch (const migration::MigrationError& e) {
      FERRY_LOG_FATAL("Sweep halted: " << e.what());
      std::cerr << "Error: " << e.what() << std::endl;
      exit_code = kExitFatal;
    }

  } catch (const std::runtime_error& e) {
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
