// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "object_transfer.hpp"

#define FERRY_LOG_COMPONENT "object_transfer"
#include "ferry_log_macros.hpp"

namespace ferry {
namespace storage {

ObjectTransfer::ObjectTransfer(
  IStorageClient& source, IStorageClient& destination, const ChunkedTransferConfig& config,
  ISessionTracker* tracker
)
    : source_(source)
    , destination_(destination)
    , engine_(destination, config, tracker) {}

TransferResult ObjectTransfer::copy(
  const std::string& source_bucket, const std::string& destination_bucket, const std::string& key,
  TransferStrategy* strategy_out, uint64_t* bytes_out
) {
  auto fetched = source_.getObject(source_bucket, key);
  if (!fetched.success) {
    return TransferResult::Failure(
      TransferError::SOURCE_READ_FAILED, "GetObject failed: " + fetched.error.message
    );
  }

  const ObjectPayload& payload = fetched.value;
  const auto strategy = selectTransferStrategy(payload.size(), engine_.config().chunk_size);
  if (strategy_out) {
    *strategy_out = strategy;
  }
  if (bytes_out) {
    *bytes_out = payload.size();
  }

  FERRY_LOG_DEBUG(
    "Transferring object" << ::ferry::logging::kv("strategy", transferStrategyToString(strategy))
                          << ::ferry::logging::kv("size", payload.size())
  );

  if (strategy == TransferStrategy::CHUNKED) {
    return engine_.transfer(destination_bucket, key, payload);
  }

  auto put = destination_.putObject(destination_bucket, key, payload);
  if (!put.success) {
    return TransferResult::Failure(TransferError::PUT_FAILED, "PutObject failed: " + put.error.message);
  }
  return TransferResult::Success();
}

}  // namespace storage
}  // namespace ferry
