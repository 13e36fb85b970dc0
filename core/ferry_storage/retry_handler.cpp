// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "retry_handler.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <unordered_map>

namespace ferry {
namespace storage {

namespace {

const std::unordered_map<std::string, ErrorClass>& knownCodes() {
  static const std::unordered_map<std::string, ErrorClass> codes = {
    // Provider throttling and overload
    {"SlowDown", ErrorClass::TRANSIENT},
    {"Throttling", ErrorClass::TRANSIENT},
    {"ThrottlingException", ErrorClass::TRANSIENT},
    {"RequestLimitExceeded", ErrorClass::TRANSIENT},
    {"ServiceUnavailable", ErrorClass::TRANSIENT},
    {"InternalError", ErrorClass::TRANSIENT},
    {"RequestTimeout", ErrorClass::TRANSIENT},
    {"RequestTimeTooSkewed", ErrorClass::TRANSIENT},
    {"OperationAborted", ErrorClass::TRANSIENT},
    {"XMinioServerNotInitialized", ErrorClass::TRANSIENT},
    // Network
    {"NetworkingError", ErrorClass::TRANSIENT},
    {"ConnectionReset", ErrorClass::TRANSIENT},
    {"ConnectionTimeout", ErrorClass::TRANSIENT},
    {"ConnectionRefused", ErrorClass::TRANSIENT},
    // Bucket naming answers drive the planner
    {"BucketAlreadyExists", ErrorClass::SEMANTIC},
    {"BucketAlreadyOwnedByYou", ErrorClass::SEMANTIC},
    {"BucketNotEmpty", ErrorClass::SEMANTIC},
    {"InvalidBucketName", ErrorClass::SEMANTIC},
    {"TooManyBuckets", ErrorClass::SEMANTIC},
    // Missing things
    {"NoSuchBucket", ErrorClass::SEMANTIC},
    {"NoSuchKey", ErrorClass::SEMANTIC},
    {"NoSuchUpload", ErrorClass::SEMANTIC},
    // Multipart protocol
    {"InvalidPart", ErrorClass::SEMANTIC},
    {"InvalidPartOrder", ErrorClass::SEMANTIC},
    {"EntityTooSmall", ErrorClass::SEMANTIC},
    {"EntityTooLarge", ErrorClass::SEMANTIC},
    // Credentials
    {"AccessDenied", ErrorClass::SEMANTIC},
    {"InvalidAccessKeyId", ErrorClass::SEMANTIC},
    {"SignatureDoesNotMatch", ErrorClass::SEMANTIC},
    {"InvalidArgument", ErrorClass::SEMANTIC},
  };
  return codes;
}

ErrorClass classifyHttpStatus(const std::string& code) {
  const std::string digits = code.substr(4);
  if (digits.empty() || !std::all_of(digits.begin(), digits.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
    return ErrorClass::UNKNOWN;
  }
  const int status = std::atoi(digits.c_str());
  if (status == 429 || (status >= 500 && status <= 599)) {
    return ErrorClass::TRANSIENT;
  }
  if (status >= 400 && status <= 499) {
    return ErrorClass::SEMANTIC;
  }
  return ErrorClass::UNKNOWN;
}

}  // namespace

const char* errorClassToString(ErrorClass error_class) {
  switch (error_class) {
    case ErrorClass::TRANSIENT:
      return "transient";
    case ErrorClass::SEMANTIC:
      return "semantic";
    case ErrorClass::UNKNOWN:
      return "unknown";
    default:
      return "invalid";
  }
}

ErrorClass classifyErrorCode(const std::string& code) {
  const auto& codes = knownCodes();
  auto it = codes.find(code);
  if (it != codes.end()) {
    return it->second;
  }
  if (code.compare(0, 4, "HTTP") == 0) {
    return classifyHttpStatus(code);
  }
  return ErrorClass::UNKNOWN;
}

RetryHandler::RetryHandler(const RetryConfig& config)
    : config_(config)
    , rng_(std::random_device{}()) {}

std::chrono::milliseconds RetryHandler::getDelay(int retry_count) const {
  const double cap = static_cast<double>(config_.max_delay.count());
  double delay_ms = static_cast<double>(config_.initial_delay.count()) *
                    std::pow(config_.exponential_base, static_cast<double>(retry_count));
  if (!std::isfinite(delay_ms) || delay_ms > cap) {
    delay_ms = cap;
  }

  if (config_.jitter && config_.jitter_factor > 0.0) {
    std::uniform_real_distribution<double> spread(
      1.0 - config_.jitter_factor, 1.0 + config_.jitter_factor
    );
    std::lock_guard<std::mutex> lock(rng_mutex_);
    delay_ms *= spread(rng_);
  }

  return std::chrono::milliseconds(static_cast<int64_t>(std::max(delay_ms, 1.0)));
}

bool RetryHandler::shouldRetryError(
  const std::string& code, bool transport_retryable, int retry_count
) const {
  if (!shouldRetry(retry_count)) {
    return false;
  }
  switch (classifyErrorCode(code)) {
    case ErrorClass::TRANSIENT:
      return true;
    case ErrorClass::SEMANTIC:
      return false;
    default:
      return transport_retryable;
  }
}

}  // namespace storage
}  // namespace ferry
