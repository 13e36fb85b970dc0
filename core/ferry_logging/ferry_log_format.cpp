// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "ferry_log_format.hpp"

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/log/attributes/current_thread_id.hpp>
#include <boost/log/attributes/value_extraction.hpp>
#include <boost/log/expressions.hpp>

#include <cstdio>
#include <sstream>

namespace ferry {
namespace logging {

namespace {

const char* severity_color(severity_level level) {
  switch (level) {
    case severity_level::debug:
      return "\033[36m";
    case severity_level::info:
      return "\033[32m";
    case severity_level::warn:
      return "\033[33m";
    case severity_level::error:
      return "\033[31m";
    case severity_level::fatal:
      return "\033[1;35m";
    default:
      return "";
  }
}

constexpr const char* kColorReset = "\033[0m";

std::string extract_string(const boost::log::record_view& rec, const char* name) {
  auto value = boost::log::extract<std::string>(name, rec);
  return value ? *value : std::string();
}

void append_json_field(
  boost::log::formatting_ostream& strm, const char* name, const std::string& value
) {
  if (!value.empty()) {
    strm << ",\"" << name << "\":\"" << escape_json(value) << "\"";
  }
}

}  // namespace

LogRecordFields extract_fields(const boost::log::record_view& rec) {
  LogRecordFields fields;

  auto time_stamp = boost::log::extract<boost::posix_time::ptime>("TimeStamp", rec);
  if (time_stamp) {
    fields.timestamp = boost::posix_time::to_iso_extended_string(*time_stamp);
  }

  auto sev = boost::log::extract<severity_level>("Severity", rec);
  if (sev) {
    fields.severity = *sev;
  }

  auto thread_id =
    boost::log::extract<boost::log::attributes::current_thread_id::value_type>("ThreadID", rec);
  if (thread_id) {
    std::ostringstream oss;
    oss << *thread_id;
    fields.thread_id = oss.str();
  }

  auto message = rec[boost::log::expressions::smessage];
  if (message) {
    fields.message = *message;
  }

  fields.component = extract_string(rec, kAttrComponent);
  fields.bucket = extract_string(rec, kAttrBucket);
  fields.object_key = extract_string(rec, kAttrObjectKey);
  fields.tool = extract_string(rec, kAttrTool);
  fields.run_id = extract_string(rec, kAttrRunId);
  return fields;
}

std::string escape_json(const std::string& s) {
  std::string result;
  result.reserve(s.size() + 16);
  for (unsigned char c : s) {
    switch (c) {
      case '"':
        result += "\\\"";
        break;
      case '\\':
        result += "\\\\";
        break;
      case '\b':
        result += "\\b";
        break;
      case '\f':
        result += "\\f";
        break;
      case '\n':
        result += "\\n";
        break;
      case '\r':
        result += "\\r";
        break;
      case '\t':
        result += "\\t";
        break;
      default:
        if (c < 0x20) {
          char buf[8];
          snprintf(buf, sizeof(buf), "\\u%04x", c);
          result += buf;
        } else {
          result += static_cast<char>(c);
        }
    }
  }
  return result;
}

void format_text(const LogRecordFields& fields, boost::log::formatting_ostream& strm, bool colors) {
  strm << "[" << fields.timestamp << "] ";

  if (fields.severity) {
    if (colors) {
      strm << severity_color(*fields.severity) << "[" << *fields.severity << "]" << kColorReset
           << " ";
    } else {
      strm << "[" << *fields.severity << "] ";
    }
  }

  if (!fields.component.empty()) {
    strm << "[" << fields.component << "] ";
  }
  strm << fields.message;

  if (!fields.bucket.empty() || !fields.object_key.empty()) {
    strm << " |";
    if (!fields.bucket.empty()) strm << " bucket=" << fields.bucket;
    if (!fields.object_key.empty()) strm << " key=" << fields.object_key;
  }
}

void format_json(const LogRecordFields& fields, boost::log::formatting_ostream& strm) {
  strm << "{\"ts\":\"" << fields.timestamp << "\"";
  if (fields.severity) {
    strm << ",\"level\":\"" << *fields.severity << "\"";
  }
  append_json_field(strm, "tool", fields.tool);
  append_json_field(strm, "run", fields.run_id);
  append_json_field(strm, "component", fields.component);
  strm << ",\"msg\":\"" << escape_json(fields.message) << "\"";
  append_json_field(strm, "thread_id", fields.thread_id);
  append_json_field(strm, "bucket", fields.bucket);
  append_json_field(strm, "key", fields.object_key);
  strm << "}";
}

}  // namespace logging
}  // namespace ferry
