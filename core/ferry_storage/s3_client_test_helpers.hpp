// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_S3_CLIENT_TEST_HELPERS_HPP
#define FERRY_S3_CLIENT_TEST_HELPERS_HPP

// This header is for testing only - exposes internal implementations
// of s3_storage_client.cpp that do not need a live endpoint

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "storage_types.hpp"

namespace ferry {
namespace storage {

/**
 * Strip a single trailing slash from an endpoint URL
 */
std::string normalizeEndpointUrl(const std::string& endpoint_url);

/**
 * Map a CreateBucket error name onto a conflict outcome
 *
 * @return Outcome for BucketAlreadyExists / BucketAlreadyOwnedByYou,
 *         std::nullopt for any other error
 */
std::optional<CreateBucketOutcome> classifyCreateBucketConflict(const std::string& exception_name);

/**
 * True when a listing page claims more results but gives no token to fetch them
 */
bool isTruncatedWithoutToken(bool is_truncated, const std::string& continuation_token);

/**
 * Compare a downloaded body against Content-Length. A length of zero is
 * treated as absent and never reported as short.
 */
bool isShortRead(int64_t content_length, size_t received);

}  // namespace storage
}  // namespace ferry

#endif  // FERRY_S3_CLIENT_TEST_HELPERS_HPP
