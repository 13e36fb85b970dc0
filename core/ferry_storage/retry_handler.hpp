// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_RETRY_HANDLER_HPP
#define FERRY_RETRY_HANDLER_HPP

#include <chrono>
#include <limits>
#include <mutex>
#include <random>
#include <string>

namespace ferry {
namespace storage {

enum class ErrorClass {
  TRANSIENT,  // Throttling, server or network trouble
  SEMANTIC,   // A definite answer: conflict, not found, denied, bad request
  UNKNOWN     // Left to the transport's own verdict
};

const char* errorClassToString(ErrorClass error_class);

/**
 * Classify a provider error code.
 *
 * Synthetic "HTTP<status>" codes (used when the provider sends no error
 * body) are transient for 429 and 5xx.
 */
ErrorClass classifyErrorCode(const std::string& code);

/**
 * Transport-level retry of storage requests
 *
 * The default budget is effectively unbounded: a migration run should ride
 * out a flaky link instead of failing objects.
 */
struct RetryConfig {
  int max_retries = std::numeric_limits<int>::max();
  std::chrono::milliseconds initial_delay{200};
  std::chrono::milliseconds max_delay{20000};
  double exponential_base = 2.0;
  bool jitter = true;
  double jitter_factor = 0.5;  // Delay multiplied by a value in [1-factor, 1+factor]
};

/**
 * Exponential backoff with jitter, shared by every request of one client.
 * getDelay() is called concurrently from part upload threads.
 */
class RetryHandler {
public:
  explicit RetryHandler(const RetryConfig& config = {});

  /**
   * min(initial_delay * base^retry_count, max_delay), then jittered.
   * Never below 1 ms.
   */
  std::chrono::milliseconds getDelay(int retry_count) const;

  bool shouldRetry(int retry_count) const {
    return retry_count < config_.max_retries;
  }

  /**
   * Decide on one failed request.
   *
   * A semantic code is final even if the transport would retry it; an
   * unknown code follows the transport.
   */
  bool shouldRetryError(const std::string& code, bool transport_retryable, int retry_count) const;

  int maxRetries() const {
    return config_.max_retries;
  }

  bool unbounded() const {
    return config_.max_retries == std::numeric_limits<int>::max();
  }

  static bool isRetryableError(const std::string& error_code) {
    return classifyErrorCode(error_code) == ErrorClass::TRANSIENT;
  }

  const RetryConfig& config() const {
    return config_;
  }

private:
  RetryConfig config_;
  mutable std::mt19937 rng_;
  mutable std::mutex rng_mutex_;
};

}  // namespace storage
}  // namespace ferry

#endif  // FERRY_RETRY_HANDLER_HPP
