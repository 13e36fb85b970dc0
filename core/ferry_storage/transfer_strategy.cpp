// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "transfer_strategy.hpp"

#include <algorithm>
#include <stdexcept>

namespace ferry {
namespace storage {

const char* transferStrategyToString(TransferStrategy strategy) {
  switch (strategy) {
    case TransferStrategy::SINGLE_PART:
      return "single_part";
    case TransferStrategy::CHUNKED:
      return "chunked";
    default:
      return "unknown";
  }
}

TransferStrategy selectTransferStrategy(uint64_t size_bytes, uint64_t chunk_size) {
  return size_bytes < chunk_size ? TransferStrategy::SINGLE_PART : TransferStrategy::CHUNKED;
}

std::vector<ChunkRange> partitionPayload(uint64_t size_bytes, uint64_t chunk_size) {
  if (chunk_size == 0) {
    throw std::invalid_argument("chunk_size must be positive");
  }

  std::vector<ChunkRange> chunks;
  chunks.reserve(static_cast<size_t>((size_bytes + chunk_size - 1) / chunk_size));

  uint64_t offset = 0;
  int part_number = 1;
  while (offset < size_bytes) {
    ChunkRange range;
    range.part_number = part_number++;
    range.offset = offset;
    range.length = std::min(chunk_size, size_bytes - offset);
    offset += range.length;
    chunks.push_back(range);
  }
  return chunks;
}

}  // namespace storage
}  // namespace ferry
