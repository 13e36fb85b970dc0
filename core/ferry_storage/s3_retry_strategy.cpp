// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "s3_retry_strategy.hpp"

#include <limits>

#define FERRY_LOG_COMPONENT "s3_retry"
#include "ferry_log_macros.hpp"

namespace ferry {
namespace storage {

namespace {

int clampRetryCount(long attempted_retries) {
  if (attempted_retries > static_cast<long>(std::numeric_limits<int>::max())) {
    return std::numeric_limits<int>::max();
  }
  return attempted_retries < 0 ? 0 : static_cast<int>(attempted_retries);
}

}  // namespace

S3RetryStrategy::S3RetryStrategy(const RetryConfig& config)
    : handler_(config) {}

bool S3RetryStrategy::ShouldRetry(
  const Aws::Client::AWSError<Aws::Client::CoreErrors>& error, long attempted_retries
) const {
  return handler_.shouldRetryError(
    error.GetExceptionName(), error.ShouldRetry(), clampRetryCount(attempted_retries)
  );
}

long S3RetryStrategy::CalculateDelayBeforeNextRetry(
  const Aws::Client::AWSError<Aws::Client::CoreErrors>& error, long attempted_retries
) const {
  auto delay = handler_.getDelay(clampRetryCount(attempted_retries));
  FERRY_LOG_WARN_EVERY_N(
    20, "Transient storage error, retrying"
          << ::ferry::logging::kv("code", std::string(error.GetExceptionName()))
          << ::ferry::logging::kv("attempt", attempted_retries + 1)
          << ::ferry::logging::kv("delay_ms", delay.count())
  );
  return static_cast<long>(delay.count());
}

long S3RetryStrategy::GetMaxAttempts() const {
  // Attempts include the initial request
  if (handler_.unbounded()) {
    return std::numeric_limits<long>::max();
  }
  return static_cast<long>(handler_.maxRetries()) + 1;
}

}  // namespace storage
}  // namespace ferry
