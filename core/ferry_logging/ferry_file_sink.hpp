// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_FILE_SINK_HPP
#define FERRY_FILE_SINK_HPP

#include <boost/log/sinks/async_frontend.hpp>
#include <boost/log/sinks/bounded_fifo_queue.hpp>
#include <boost/log/sinks/drop_on_overflow.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/smart_ptr/shared_ptr.hpp>

#include <cstdint>
#include <string>

#include "ferry_log_severity.hpp"

namespace ferry {
namespace logging {

typedef boost::log::sinks::asynchronous_sink<
  boost::log::sinks::text_file_backend,
  boost::log::sinks::bounded_fifo_queue<5000, boost::log::sinks::drop_on_overflow>>
  async_file_sink_t;

struct FileSinkConfig {
  std::string directory = "/var/log/ferry";
  // Boost.Log file name pattern; empty derives "<tool>_%Y%m%d_%H%M%S_%N.log"
  std::string file_pattern;
  uint64_t rotation_size_mb = 100;
  bool rotate_at_midnight = true;
  int max_files = 10;
  bool format_json = true;
};

/**
 * File name pattern used for a tool, honouring an explicit pattern.
 */
std::string resolve_file_pattern(const FileSinkConfig& config, const std::string& tool_name);

/**
 * Create the rotating file sink.
 *
 * A long migration writes one file per run and rotates by size and at
 * midnight; the collector keeps at most max_files. If the directory cannot
 * be created the sink falls back to <tmp>/ferry.
 */
boost::shared_ptr<async_file_sink_t> create_file_sink(
  const FileSinkConfig& config, severity_level min_level = severity_level::debug,
  const std::string& tool_name = "ferry"
);

}  // namespace logging
}  // namespace ferry

#endif  // FERRY_FILE_SINK_HPP
