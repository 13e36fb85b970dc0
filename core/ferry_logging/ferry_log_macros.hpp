// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_LOG_MACROS_HPP
#define FERRY_LOG_MACROS_HPP

#include <boost/log/attributes/constant.hpp>
#include <boost/log/attributes/scoped_attribute.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/utility/manipulators/add_value.hpp>

#include <atomic>
#include <cstdint>
#include <sstream>
#include <string>

#include "ferry_log_format.hpp"
#include "ferry_log_severity.hpp"

namespace ferry {
namespace logging {

// Global severity logger type (thread-safe variant, transfers log from part workers)
typedef boost::log::sources::severity_logger_mt<severity_level> logger_type;

/**
 * Get the global logger instance.
 * Defined in ferry_log_init.cpp
 */
logger_type& get_logger();

/**
 * Key-value formatter for structured logging.
 * Usage: FERRY_LOG_INFO("message" << kv("key", value));
 */
template <typename T>
inline std::string kv(const char* name, const T& value) {
  std::ostringstream oss;
  oss << " " << name << "=" << value;
  return oss.str();
}

template <>
inline std::string kv(const char* name, const std::string& value) {
  std::ostringstream oss;
  oss << " " << name << "=\"" << value << "\"";
  return oss.str();
}

inline std::string kv(const char* name, const char* value) {
  std::ostringstream oss;
  oss << " " << name << "=\"" << value << "\"";
  return oss.str();
}

}  // namespace logging
}  // namespace ferry

// =============================================================================
// Component identification
// Define FERRY_LOG_COMPONENT before including this header:
//
//   #define FERRY_LOG_COMPONENT "migration_planner"
//   #include "ferry_log_macros.hpp"
// =============================================================================
#ifndef FERRY_LOG_COMPONENT
#define FERRY_LOG_COMPONENT "ferry"
#endif

// Attached to every record as the "Component" attribute
#define FERRY_LOG_COMPONENT_ATTR                                                                \
  ::boost::log::add_value(::ferry::logging::kAttrComponent, std::string(FERRY_LOG_COMPONENT))

// DEBUG records are compiled out of release builds
#ifdef NDEBUG
#define FERRY_LOG_ENABLE_DEBUG 0
#else
#define FERRY_LOG_ENABLE_DEBUG 1
#endif

#define FERRY_LOG_DEBUG(msg)                                                                    \
  do {                                                                                          \
    if (FERRY_LOG_ENABLE_DEBUG) {                                                               \
      BOOST_LOG_SEV(::ferry::logging::get_logger(), ::ferry::logging::severity_level::debug)    \
        << FERRY_LOG_COMPONENT_ATTR << msg;                                                     \
    }                                                                                           \
  } while (0)

#define FERRY_LOG_INFO(msg)                                                                     \
  do {                                                                                          \
    BOOST_LOG_SEV(::ferry::logging::get_logger(), ::ferry::logging::severity_level::info)       \
      << FERRY_LOG_COMPONENT_ATTR << msg;                                                       \
  } while (0)

#define FERRY_LOG_WARN(msg)                                                                     \
  do {                                                                                          \
    BOOST_LOG_SEV(::ferry::logging::get_logger(), ::ferry::logging::severity_level::warn)       \
      << FERRY_LOG_COMPONENT_ATTR << msg;                                                       \
  } while (0)

#define FERRY_LOG_ERROR(msg)                                                                    \
  do {                                                                                          \
    BOOST_LOG_SEV(::ferry::logging::get_logger(), ::ferry::logging::severity_level::error)      \
      << FERRY_LOG_COMPONENT_ATTR << msg;                                                       \
  } while (0)

#define FERRY_LOG_FATAL(msg)                                                                    \
  do {                                                                                          \
    BOOST_LOG_SEV(::ferry::logging::get_logger(), ::ferry::logging::severity_level::fatal)      \
      << FERRY_LOG_COMPONENT_ATTR << msg;                                                       \
  } while (0)

// =============================================================================
// Scoped bucket/object context, cleared when the scope exits.
// Usage: FERRY_LOG_SCOPED_CONTEXT(bucket_name, object_key);
// =============================================================================
#define FERRY_LOG_SCOPED_CONTEXT(bucket_val, object_key_val)                                    \
  ::boost::log::scoped_attribute _ferry_log_bucket_scope =                                      \
    ::boost::log::add_scoped_thread_attribute(                                                  \
      ::ferry::logging::kAttrBucket, ::boost::log::attributes::constant<std::string>(bucket_val) \
    );                                                                                          \
  ::boost::log::scoped_attribute _ferry_log_key_scope =                                         \
    ::boost::log::add_scoped_thread_attribute(                                                  \
      ::ferry::logging::kAttrObjectKey,                                                         \
      ::boost::log::attributes::constant<std::string>(object_key_val)                           \
    );                                                                                          \
  (void)_ferry_log_bucket_scope;                                                                \
  (void)_ferry_log_key_scope

// =============================================================================
// Count-based sampling: log the 1st, (n+1)th, (2n+1)th... occurrence per call site.
// Usage: FERRY_LOG_INFO_EVERY_N(500, "Deleting objects" << kv("done", i));
// =============================================================================
#define FERRY_LOG_INFO_EVERY_N(n, msg)                                                          \
  do {                                                                                          \
    static std::atomic<uint64_t> _ferry_log_counter{0};                                         \
    if ((++_ferry_log_counter % (n)) == 1) {                                                    \
      FERRY_LOG_INFO(msg);                                                                      \
    }                                                                                           \
  } while (0)

#define FERRY_LOG_WARN_EVERY_N(n, msg)                                                          \
  do {                                                                                          \
    static std::atomic<uint64_t> _ferry_log_counter{0};                                         \
    if ((++_ferry_log_counter % (n)) == 1) {                                                    \
      FERRY_LOG_WARN(msg);                                                                      \
    }                                                                                           \
  } while (0)

#endif  // FERRY_LOG_MACROS_HPP
