// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "ferry_file_sink.hpp"

#include <boost/filesystem.hpp>
#include <boost/log/expressions.hpp>
#include <boost/make_shared.hpp>

#include <iostream>

#include "ferry_log_format.hpp"

namespace ferry {
namespace logging {

namespace keywords = boost::log::keywords;
namespace sinks = boost::log::sinks;

namespace {

// Logging is not up while the sink is built, so problems go to stderr
boost::filesystem::path prepare_directory(const std::string& directory) {
  boost::filesystem::path dir_path(directory);
  boost::system::error_code ec;
  boost::filesystem::create_directories(dir_path, ec);
  if (!ec) {
    return dir_path;
  }

  boost::filesystem::path fallback = boost::filesystem::temp_directory_path() / "ferry";
  std::cerr << "[ferry_logging] Could not create log directory '" << directory
            << "': " << ec.message() << ", writing to " << fallback.string() << "\n";
  boost::filesystem::create_directories(fallback, ec);
  if (ec) {
    std::cerr << "[ferry_logging] Could not create " << fallback.string() << ": " << ec.message()
              << "\n";
  }
  return fallback;
}

}  // namespace

std::string resolve_file_pattern(const FileSinkConfig& config, const std::string& tool_name) {
  if (!config.file_pattern.empty()) {
    return config.file_pattern;
  }
  return (tool_name.empty() ? std::string("ferry") : tool_name) + "_%Y%m%d_%H%M%S_%N.log";
}

boost::shared_ptr<async_file_sink_t> create_file_sink(
  const FileSinkConfig& config, severity_level min_level, const std::string& tool_name
) {
  const boost::filesystem::path log_dir = prepare_directory(config.directory);

  auto backend = boost::make_shared<sinks::text_file_backend>(
    keywords::file_name = (log_dir / resolve_file_pattern(config, tool_name)).string(),
    keywords::rotation_size = config.rotation_size_mb * 1024 * 1024,
    keywords::auto_flush = true
  );
  if (config.rotate_at_midnight) {
    backend->set_time_based_rotation(sinks::file::rotation_at_time_point(0, 0, 0));
  }
  backend->set_file_collector(sinks::file::make_collector(
    keywords::target = log_dir, keywords::max_files = config.max_files
  ));
  backend->scan_for_files();

  auto sink = boost::make_shared<async_file_sink_t>(backend);
  sink->set_filter(severity >= min_level);

  if (config.format_json) {
    sink->set_formatter([](boost::log::record_view const& rec, boost::log::formatting_ostream& strm) {
      format_json(extract_fields(rec), strm);
    });
  } else {
    sink->set_formatter([](boost::log::record_view const& rec, boost::log::formatting_ostream& strm) {
      format_text(extract_fields(rec), strm, false);
    });
  }
  return sink;
}

}  // namespace logging
}  // namespace ferry
