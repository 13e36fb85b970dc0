// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include <gtest/gtest.h>

#include <chrono>
#include <limits>
#include <set>

#include "retry_handler.hpp"

using namespace ferry::storage;

namespace {

RetryConfig deterministicConfig() {
  RetryConfig config;
  config.max_retries = 5;
  config.initial_delay = std::chrono::milliseconds(100);
  config.max_delay = std::chrono::milliseconds(5000);
  config.jitter = false;
  return config;
}

}  // namespace

TEST(RetryBackoffTest, DoublesUntilCap) {
  RetryHandler handler(deterministicConfig());
  EXPECT_EQ(handler.getDelay(0).count(), 100);
  EXPECT_EQ(handler.getDelay(1).count(), 200);
  EXPECT_EQ(handler.getDelay(3).count(), 800);
  EXPECT_EQ(handler.getDelay(6).count(), 5000);
}

TEST(RetryBackoffTest, HugeRetryCountStaysAtCap) {
  // Unbounded budgets reach counts where base^n overflows a double
  RetryHandler handler(deterministicConfig());
  EXPECT_EQ(handler.getDelay(5000).count(), 5000);
  EXPECT_EQ(handler.getDelay(std::numeric_limits<int>::max()).count(), 5000);
}

TEST(RetryBackoffTest, NeverBelowOneMillisecond) {
  RetryConfig config = deterministicConfig();
  config.initial_delay = std::chrono::milliseconds(0);
  RetryHandler handler(config);
  EXPECT_EQ(handler.getDelay(0).count(), 1);
}

TEST(RetryBackoffTest, JitterSpreadsAroundBase) {
  RetryConfig config;
  config.initial_delay = std::chrono::milliseconds(1000);
  config.jitter_factor = 0.25;
  RetryHandler handler(config);

  std::set<int64_t> seen;
  for (int i = 0; i < 200; ++i) {
    const int64_t delay = handler.getDelay(0).count();
    EXPECT_GE(delay, 750);
    EXPECT_LE(delay, 1250);
    seen.insert(delay);
  }
  EXPECT_GT(seen.size(), 1u);
}

TEST(RetryBudgetTest, BoundedBudget) {
  RetryHandler handler(deterministicConfig());
  EXPECT_FALSE(handler.unbounded());
  EXPECT_TRUE(handler.shouldRetry(4));
  EXPECT_FALSE(handler.shouldRetry(5));
}

TEST(RetryBudgetTest, DefaultBudgetIsUnbounded) {
  RetryHandler handler;
  EXPECT_TRUE(handler.unbounded());
  EXPECT_TRUE(handler.shouldRetry(10000000));
}

TEST(ErrorClassTest, ThrottlingAndNetworkAreTransient) {
  for (const char* code : {"SlowDown", "RequestTimeout", "ServiceUnavailable", "InternalError",
                           "NetworkingError", "Throttling", "XMinioServerNotInitialized"}) {
    EXPECT_EQ(classifyErrorCode(code), ErrorClass::TRANSIENT) << code;
  }
}

TEST(ErrorClassTest, ConflictsAndMissingObjectsAreSemantic) {
  for (const char* code : {"BucketAlreadyExists", "BucketAlreadyOwnedByYou", "NoSuchKey",
                           "NoSuchBucket", "NoSuchUpload", "AccessDenied", "InvalidPartOrder"}) {
    EXPECT_EQ(classifyErrorCode(code), ErrorClass::SEMANTIC) << code;
  }
}

TEST(ErrorClassTest, BareHttpStatusCodes) {
  EXPECT_EQ(classifyErrorCode("HTTP503"), ErrorClass::TRANSIENT);
  EXPECT_EQ(classifyErrorCode("HTTP429"), ErrorClass::TRANSIENT);
  EXPECT_EQ(classifyErrorCode("HTTP404"), ErrorClass::SEMANTIC);
  EXPECT_EQ(classifyErrorCode("HTTP"), ErrorClass::UNKNOWN);
  EXPECT_EQ(classifyErrorCode("HTTPabc"), ErrorClass::UNKNOWN);
}

TEST(ErrorClassTest, UnrecognisedCodesAreUnknown) {
  EXPECT_EQ(classifyErrorCode(""), ErrorClass::UNKNOWN);
  EXPECT_EQ(classifyErrorCode("SomethingNew"), ErrorClass::UNKNOWN);
  EXPECT_STREQ(errorClassToString(ErrorClass::UNKNOWN), "unknown");
  EXPECT_FALSE(RetryHandler::isRetryableError("SomethingNew"));
  EXPECT_TRUE(RetryHandler::isRetryableError("SlowDown"));
}

TEST(RetryDecisionTest, SemanticCodeOverridesTransport) {
  RetryHandler handler;
  EXPECT_FALSE(handler.shouldRetryError("BucketAlreadyExists", true, 0));
  EXPECT_FALSE(handler.shouldRetryError("NoSuchKey", true, 0));
}

TEST(RetryDecisionTest, TransientCodeRetriesWithinBudget) {
  RetryHandler handler(deterministicConfig());
  EXPECT_TRUE(handler.shouldRetryError("SlowDown", false, 0));
  EXPECT_FALSE(handler.shouldRetryError("SlowDown", false, 5));
}

TEST(RetryDecisionTest, UnknownCodeFollowsTransport) {
  RetryHandler handler;
  EXPECT_TRUE(handler.shouldRetryError("SomethingNew", true, 3));
  EXPECT_FALSE(handler.shouldRetryError("SomethingNew", false, 3));
}
