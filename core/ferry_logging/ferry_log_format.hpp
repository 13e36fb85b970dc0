// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_LOG_FORMAT_HPP
#define FERRY_LOG_FORMAT_HPP

#include <boost/log/core/record_view.hpp>
#include <boost/log/utility/formatting_ostream.hpp>

#include <optional>
#include <string>

#include "ferry_log_severity.hpp"

namespace ferry {
namespace logging {

// Attribute names shared by the macros, init and the formatters
constexpr const char* kAttrComponent = "Component";
constexpr const char* kAttrBucket = "Bucket";
constexpr const char* kAttrObjectKey = "ObjectKey";
constexpr const char* kAttrTool = "Tool";
constexpr const char* kAttrRunId = "RunId";

/**
 * Attribute values of one record, extracted once and rendered by either
 * the text or the JSON layout.
 */
struct LogRecordFields {
  std::string timestamp;
  std::optional<severity_level> severity;
  std::string component;
  std::string message;
  std::string thread_id;
  std::string bucket;
  std::string object_key;
  std::string tool;
  std::string run_id;
};

LogRecordFields extract_fields(const boost::log::record_view& rec);

/**
 * Escape a string for JSON output (RFC 8259 control characters included).
 */
std::string escape_json(const std::string& s);

/**
 * "[ts] [LEVEL] [component] message | bucket=... key=..."
 *
 * With colors the severity tag is wrapped in ANSI codes.
 */
void format_text(const LogRecordFields& fields, boost::log::formatting_ostream& strm, bool colors);

/**
 * One JSON object per record. Empty context fields are omitted.
 */
void format_json(const LogRecordFields& fields, boost::log::formatting_ostream& strm);

}  // namespace logging
}  // namespace ferry

#endif  // FERRY_LOG_FORMAT_HPP
