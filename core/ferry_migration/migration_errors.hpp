// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_MIGRATION_ERRORS_HPP
#define FERRY_MIGRATION_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace ferry {
namespace migration {

enum class MigrationErrorKind {
  CONFIGURATION,          // Invalid setup, detected before any transfer
  NO_SUFFIX_CONFIGURED,   // Name taken at destination and no suffix to fall back on
  BUCKET_NAME_EXHAUSTED,  // Suffixed name taken as well
  BUCKET_CREATE_FAILED,   // CreateBucket failed for another reason
  LISTING                 // Bucket or object listing failed
};

inline const char* migrationErrorKindToString(MigrationErrorKind kind) {
  switch (kind) {
    case MigrationErrorKind::CONFIGURATION:
      return "configuration";
    case MigrationErrorKind::NO_SUFFIX_CONFIGURED:
      return "no_suffix_configured";
    case MigrationErrorKind::BUCKET_NAME_EXHAUSTED:
      return "bucket_name_exhausted";
    case MigrationErrorKind::BUCKET_CREATE_FAILED:
      return "bucket_create_failed";
    case MigrationErrorKind::LISTING:
      return "listing";
    default:
      return "unknown";
  }
}

/**
 * Fatal condition for a bucket or for the whole run
 *
 * Raised by the planner and the sweeper; the driver decides the exit code.
 */
class MigrationError : public std::runtime_error {
public:
  MigrationError(MigrationErrorKind kind, const std::string& bucket, const std::string& message)
      : std::runtime_error(message)
      , kind_(kind)
      , bucket_(bucket) {}

  MigrationErrorKind kind() const noexcept {
    return kind_;
  }

  // Empty for errors not tied to a bucket
  const std::string& bucket() const noexcept {
    return bucket_;
  }

private:
  MigrationErrorKind kind_;
  std::string bucket_;
};

}  // namespace migration
}  // namespace ferry

#endif  // FERRY_MIGRATION_ERRORS_HPP
