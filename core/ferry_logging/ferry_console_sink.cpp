// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "ferry_console_sink.hpp"

#include <boost/core/null_deleter.hpp>
#include <boost/log/expressions.hpp>
#include <boost/make_shared.hpp>

#include <unistd.h>

#include <cstdio>
#include <cstdlib>
#include <iostream>

#include "ferry_log_format.hpp"

namespace ferry {
namespace logging {

bool console_colors_supported(bool requested) {
  if (!requested) {
    return false;
  }
  const char* no_color = std::getenv("NO_COLOR");
  if (no_color != nullptr && no_color[0] != '\0') {
    return false;
  }
  return isatty(fileno(stderr)) != 0;
}

boost::shared_ptr<async_console_sink_t> create_console_sink(
  severity_level min_level, bool use_colors
) {
  auto backend = boost::make_shared<boost::log::sinks::text_ostream_backend>();
  backend->add_stream(boost::shared_ptr<std::ostream>(&std::cerr, boost::null_deleter()));
  backend->auto_flush(true);

  auto sink = boost::make_shared<async_console_sink_t>(backend);
  sink->set_filter(severity >= min_level);

  const bool colors = console_colors_supported(use_colors);
  sink->set_formatter(
    [colors](boost::log::record_view const& rec, boost::log::formatting_ostream& strm) {
      format_text(extract_fields(rec), strm, colors);
    }
  );
  return sink;
}

}  // namespace logging
}  // namespace ferry
