// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_SESSION_TRACKER_HPP
#define FERRY_SESSION_TRACKER_HPP

#include <string>

namespace ferry {
namespace storage {

/**
 * Observer of multipart session lifetime
 *
 * onSessionClosed() is only called once the destination confirmed the
 * completion or abort. A session whose abort failed stays open.
 */
class ISessionTracker {
public:
  virtual ~ISessionTracker() = default;

  virtual void onSessionOpened(
    const std::string& bucket, const std::string& key, const std::string& upload_id
  ) = 0;

  virtual void onSessionClosed(const std::string& upload_id) = 0;
};

}  // namespace storage
}  // namespace ferry

#endif  // FERRY_SESSION_TRACKER_HPP
