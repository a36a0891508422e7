#pragma once

#include <cstdint>
#include <map>
#include <vector>

#include "container/decode_result.hpp"
#include "container/read_options.hpp"
#include "io/byte_source.hpp"
#include "io/image_types.hpp"

namespace e2e {

struct ChunkLocation {
    uint32_t start = 0;
    uint32_t size = 0;
};

using VolumeTable = std::map<VolumeKey, Volume>;

struct ChunkIndex {
    // per-volume slice count, per ReadOptions::slice_count_rule
    std::map<VolumeKey, int64_t> slice_counts;
    // live chunks in directory order (block order, then entry order)
    std::vector<ChunkLocation> chunks;
    size_t entries_seen = 0;
    // odd slice ids on stale entries; live ones are reported at placement
    std::vector<DecodeIssue> issues;
};

// Re-reads every block in `block_offsets` with its entries. Truncation
// propagates.
ChunkIndex build_chunk_index(ByteSource& src, const std::vector<uint32_t>& block_offsets,
                             const ReadOptions& opt);

// Slice arrays for every volume that gets one, all slots EmptySlice.
VolumeTable materialize_volumes(const ChunkIndex& index, const ReadOptions& opt);

} // namespace e2e
