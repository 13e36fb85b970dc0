// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_S3_STORAGE_CLIENT_HPP
#define FERRY_S3_STORAGE_CLIENT_HPP

#include <memory>
#include <string>
#include <vector>

#include "retry_handler.hpp"
#include "storage_client.hpp"

namespace ferry {
namespace storage {

/**
 * Connection settings for one S3-compatible endpoint
 */
struct S3Config {
  std::string endpoint_url;  // e.g. "http://minio.local:9000", empty for AWS defaults
  std::string region = "us-east-1";
  bool use_ssl = true;
  bool verify_ssl = true;

  // Credential lookup order:
  //   1. credentials_file + profile (AWS shared credentials format)
  //   2. access_key / secret_key
  //   3. AWS default provider chain (environment, ~/.aws, instance metadata)
  std::string credentials_file;
  std::string profile = "default";
  std::string access_key;
  std::string secret_key;

  // Timeouts (in milliseconds)
  int connect_timeout_ms = 10000;
  int request_timeout_ms = 300000;  // 5 minutes for 5 MiB parts on slow links

  // Must cover the part workers of the chunked transfer
  int max_connections = 25;

  RetryConfig retry;
};

/**
 * IStorageClient backed by the AWS SDK for C++
 *
 * Path-style addressing is always used so that S3-compatible providers work
 * with custom endpoints. Transient failures are retried inside the SDK via
 * S3RetryStrategy. Thread-safe.
 */
class S3StorageClient : public IStorageClient {
public:
  explicit S3StorageClient(const S3Config& config);
  ~S3StorageClient() override;

  // Non-copyable
  S3StorageClient(const S3StorageClient&) = delete;
  S3StorageClient& operator=(const S3StorageClient&) = delete;

  StorageResult<std::vector<std::string>> listBuckets() override;

  /**
   * Create a bucket with a location constraint matching the configured region
   *
   * BucketAlreadyOwnedByYou and BucketAlreadyExists are reported as outcomes,
   * not failures.
   */
  StorageResult<CreateBucketOutcome> createBucket(const std::string& bucket) override;

  StorageStatus deleteBucket(const std::string& bucket) override;

  StorageResult<ObjectPage> listObjects(
    const std::string& bucket, const std::string& continuation, int page_size
  ) override;

  StorageResult<ObjectPayload> getObject(
    const std::string& bucket, const std::string& key
  ) override;

  StorageStatus putObject(
    const std::string& bucket, const std::string& key, const ObjectPayload& payload
  ) override;

  StorageResult<std::string> createMultipartUpload(
    const std::string& bucket, const std::string& key
  ) override;

  StorageResult<std::string> uploadPart(
    const std::string& bucket, const std::string& key, const std::string& upload_id,
    int part_number, const uint8_t* data, size_t length
  ) override;

  StorageStatus completeMultipartUpload(
    const std::string& bucket, const std::string& key, const std::string& upload_id,
    const std::vector<CompletedPart>& parts
  ) override;

  StorageStatus abortMultipartUpload(
    const std::string& bucket, const std::string& key, const std::string& upload_id
  ) override;

  StorageStatus deleteObject(const std::string& bucket, const std::string& key) override;

  const std::string& region() const;
  const std::string& endpoint() const;

private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace storage
}  // namespace ferry

#endif  // FERRY_S3_STORAGE_CLIENT_HPP
