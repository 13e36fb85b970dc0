// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_CONSOLE_SINK_HPP
#define FERRY_CONSOLE_SINK_HPP

#include <boost/log/sinks/async_frontend.hpp>
#include <boost/log/sinks/bounded_fifo_queue.hpp>
#include <boost/log/sinks/drop_on_overflow.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/smart_ptr/shared_ptr.hpp>

#include "ferry_log_severity.hpp"

namespace ferry {
namespace logging {

// Drops on overflow so part workers never block on a slow terminal
typedef boost::log::sinks::asynchronous_sink<
  boost::log::sinks::text_ostream_backend,
  boost::log::sinks::bounded_fifo_queue<1000, boost::log::sinks::drop_on_overflow>>
  async_console_sink_t;

/**
 * Decide whether the console sink may emit ANSI colors.
 *
 * Colors stay off when not requested, when NO_COLOR is set, or when stderr
 * is not a terminal (cron jobs, redirected output).
 */
bool console_colors_supported(bool requested);

/**
 * Create the console sink. Records go to stderr so the run summary printed
 * on stdout can be captured on its own.
 */
boost::shared_ptr<async_console_sink_t> create_console_sink(
  severity_level min_level = severity_level::info, bool use_colors = true
);

}  // namespace logging
}  // namespace ferry

#endif  // FERRY_CONSOLE_SINK_HPP
