// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for S3StorageClient internals that need no endpoint
 */

#include <gtest/gtest.h>

#include <stdexcept>

#include "s3_client_test_helpers.hpp"
#include "s3_storage_client.hpp"

using namespace ferry::storage;

TEST(S3ClientHelpersTest, EndpointTrailingSlashIsStripped) {
  EXPECT_EQ(normalizeEndpointUrl("http://minio:9000/"), "http://minio:9000");
  EXPECT_EQ(normalizeEndpointUrl("http://minio:9000"), "http://minio:9000");
  EXPECT_EQ(normalizeEndpointUrl(""), "");
}

TEST(S3ClientHelpersTest, ConflictNamesAreClassified) {
  auto owned = classifyCreateBucketConflict("BucketAlreadyOwnedByYou");
  ASSERT_TRUE(owned.has_value());
  EXPECT_EQ(*owned, CreateBucketOutcome::ALREADY_OWNED_BY_YOU);

  auto taken = classifyCreateBucketConflict("BucketAlreadyExists");
  ASSERT_TRUE(taken.has_value());
  EXPECT_EQ(*taken, CreateBucketOutcome::ALREADY_EXISTS);
}

TEST(S3ClientHelpersTest, OtherErrorsAreNotConflicts) {
  EXPECT_FALSE(classifyCreateBucketConflict("AccessDenied").has_value());
  EXPECT_FALSE(classifyCreateBucketConflict("InvalidBucketName").has_value());
  EXPECT_FALSE(classifyCreateBucketConflict("").has_value());
}

TEST(S3ClientHelpersTest, TruncatedPageNeedsContinuationToken) {
  EXPECT_TRUE(isTruncatedWithoutToken(true, ""));
  EXPECT_FALSE(isTruncatedWithoutToken(true, "token-2"));
  EXPECT_FALSE(isTruncatedWithoutToken(false, ""));
}

TEST(S3ClientHelpersTest, MissingContentLengthIsNotShortRead) {
  EXPECT_FALSE(isShortRead(0, 4096));
  EXPECT_FALSE(isShortRead(0, 0));
  EXPECT_FALSE(isShortRead(10, 10));
  EXPECT_TRUE(isShortRead(10, 4));
  EXPECT_TRUE(isShortRead(10, 12));
}

TEST(S3ConfigTest, Defaults) {
  S3Config config;
  EXPECT_EQ(config.region, "us-east-1");
  EXPECT_EQ(config.profile, "default");
  EXPECT_TRUE(config.endpoint_url.empty());
  EXPECT_TRUE(config.use_ssl);
  EXPECT_GT(config.max_connections, 8);
}

TEST(S3ConfigTest, ClientConstructsWithExplicitKeys) {
  S3Config config;
  config.endpoint_url = "http://127.0.0.1:1/";
  config.region = "eu-central-1";
  config.use_ssl = false;
  config.access_key = "test";
  config.secret_key = "test";

  S3StorageClient client(config);
  EXPECT_EQ(client.region(), "eu-central-1");
  EXPECT_EQ(client.endpoint(), "http://127.0.0.1:1/");
}

TEST(S3ConfigTest, MissingCredentialsFileThrows) {
  S3Config config;
  config.credentials_file = "/nonexistent/ferry/.old.credentials";
  EXPECT_THROW(S3StorageClient client(config), std::runtime_error);
}
