// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_TRANSFER_STRATEGY_HPP
#define FERRY_TRANSFER_STRATEGY_HPP

#include <cstdint>
#include <vector>

#include "storage_types.hpp"

namespace ferry {
namespace storage {

enum class TransferStrategy {
  SINGLE_PART,  // One PutObject
  CHUNKED       // Multipart session
};

const char* transferStrategyToString(TransferStrategy strategy);

/**
 * Route an object by size
 *
 * @return SINGLE_PART if size_bytes < chunk_size, CHUNKED otherwise
 */
TransferStrategy selectTransferStrategy(uint64_t size_bytes, uint64_t chunk_size = kChunkSize);

/**
 * Byte range of one chunk
 */
struct ChunkRange {
  int part_number = 0;  // 1-based
  uint64_t offset = 0;
  uint64_t length = 0;
};

/**
 * Cut a payload of size_bytes into chunk_size slices
 *
 * Part numbers are 1-based and gapless; only the last chunk may be shorter.
 * A zero-length payload yields no chunks.
 *
 * @throws std::invalid_argument if chunk_size is 0
 */
std::vector<ChunkRange> partitionPayload(uint64_t size_bytes, uint64_t chunk_size = kChunkSize);

}  // namespace storage
}  // namespace ferry

#endif  // FERRY_TRANSFER_STRATEGY_HPP
