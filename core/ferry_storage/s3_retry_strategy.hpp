// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_S3_RETRY_STRATEGY_HPP
#define FERRY_S3_RETRY_STRATEGY_HPP

#include <aws/core/client/AWSError.h>
#include <aws/core/client/CoreErrors.h>
#include <aws/core/client/RetryStrategy.h>

#include "retry_handler.hpp"

namespace ferry {
namespace storage {

/**
 * AWS SDK retry strategy backed by RetryHandler
 *
 * Installed on every S3 client so transient failures are retried inside the
 * SDK transport, invisible to the migration logic.
 */
class S3RetryStrategy : public Aws::Client::RetryStrategy {
public:
  explicit S3RetryStrategy(const RetryConfig& config);

  bool ShouldRetry(
    const Aws::Client::AWSError<Aws::Client::CoreErrors>& error, long attempted_retries
  ) const override;

  long CalculateDelayBeforeNextRetry(
    const Aws::Client::AWSError<Aws::Client::CoreErrors>& error, long attempted_retries
  ) const override;

  long GetMaxAttempts() const override;

private:
  RetryHandler handler_;
};

}  // namespace storage
}  // namespace ferry

#endif  // FERRY_S3_RETRY_STRATEGY_HPP
