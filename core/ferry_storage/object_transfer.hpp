// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_OBJECT_TRANSFER_HPP
#define FERRY_OBJECT_TRANSFER_HPP

#include <string>

#include "chunked_transfer_engine.hpp"
#include "transfer_strategy.hpp"

namespace ferry {
namespace storage {

/**
 * Copy one object from a source to a destination endpoint
 *
 * Reads the whole payload from the source, then routes it through
 * selectTransferStrategy(): PutObject below the chunk size, the chunked
 * engine otherwise.
 */
class ObjectTransfer {
public:
  ObjectTransfer(
    IStorageClient& source, IStorageClient& destination, const ChunkedTransferConfig& config = {},
    ISessionTracker* tracker = nullptr
  );

  /**
   * @param strategy_out Receives the chosen strategy when the source read succeeds
   */
  TransferResult copy(
    const std::string& source_bucket, const std::string& destination_bucket,
    const std::string& key, TransferStrategy* strategy_out = nullptr, uint64_t* bytes_out = nullptr
  );

private:
  IStorageClient& source_;
  IStorageClient& destination_;
  ChunkedTransferEngine engine_;
};

}  // namespace storage
}  // namespace ferry

#endif  // FERRY_OBJECT_TRANSFER_HPP
