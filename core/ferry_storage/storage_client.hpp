// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_STORAGE_CLIENT_HPP
#define FERRY_STORAGE_CLIENT_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "storage_types.hpp"

namespace ferry {
namespace storage {

/**
 * Object storage capability used by the migration engine and the sweeper
 *
 * One instance is bound to one endpoint/region. Implementations absorb
 * transient failures (network errors, throttling) and only report an error
 * once retrying is pointless. Semantic answers such as a bucket-name
 * conflict are never retried.
 *
 * uploadPart() is called from several threads at once for the same session;
 * implementations must allow that.
 */
class IStorageClient {
public:
  virtual ~IStorageClient() = default;

  virtual StorageResult<std::vector<std::string>> listBuckets() = 0;

  virtual StorageResult<CreateBucketOutcome> createBucket(const std::string& bucket) = 0;

  virtual StorageStatus deleteBucket(const std::string& bucket) = 0;

  /**
   * List one page of objects
   *
   * @param continuation Token from the previous page, empty for the first page
   * @param page_size Requested page size, 0 for the provider default
   */
  virtual StorageResult<ObjectPage> listObjects(
    const std::string& bucket, const std::string& continuation, int page_size
  ) = 0;

  virtual StorageResult<ObjectPayload> getObject(
    const std::string& bucket, const std::string& key
  ) = 0;

  virtual StorageStatus putObject(
    const std::string& bucket, const std::string& key, const ObjectPayload& payload
  ) = 0;

  /**
   * Open a multipart session
   *
   * @return Upload identifier issued by the destination
   */
  virtual StorageResult<std::string> createMultipartUpload(
    const std::string& bucket, const std::string& key
  ) = 0;

  /**
   * Upload one part of an open session
   *
   * @return Part tag (ETag) required to complete the session
   */
  virtual StorageResult<std::string> uploadPart(
    const std::string& bucket, const std::string& key, const std::string& upload_id,
    int part_number, const uint8_t* data, size_t length
  ) = 0;

  virtual StorageStatus completeMultipartUpload(
    const std::string& bucket, const std::string& key, const std::string& upload_id,
    const std::vector<CompletedPart>& parts
  ) = 0;

  virtual StorageStatus abortMultipartUpload(
    const std::string& bucket, const std::string& key, const std::string& upload_id
  ) = 0;

  virtual StorageStatus deleteObject(const std::string& bucket, const std::string& key) = 0;
};

}  // namespace storage
}  // namespace ferry

#endif  // FERRY_STORAGE_CLIENT_HPP
