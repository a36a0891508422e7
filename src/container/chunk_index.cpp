#include "container/chunk_index.hpp"

#include "format/e2e_format.hpp"
#include "format/records.hpp"
#include "util/log.hpp"

#include <algorithm>
#include <string>

namespace e2e {

namespace {

static int64_t slice_count_of(const DirectoryEntry& e, SliceCountRule rule) {
    if (rule == SliceCountRule::RawSliceId) return e.slice_id;
    return e.slice_id / 2;
}

} // namespace

ChunkIndex build_chunk_index(ByteSource& src, const std::vector<uint32_t>& block_offsets,
                             const ReadOptions& opt) {
    ChunkIndex index;
    for (uint32_t block_pos : block_offsets) {
        const auto raw = src.read_at(block_pos, kDirectoryBlockBytes, "index: directory block");
        const DirectoryBlock block = parse_directory_block(raw, block_pos);

        for (uint32_t i = 0; i < block.num_entries; ++i) {
            const uint64_t entry_pos = src.tell();
            const DirectoryEntry e =
                parse_directory_entry(src.read(kDirectoryEntryBytes, "index: directory entry"), entry_pos);
            ++index.entries_seen;

            const VolumeKey key{e.patient_id, e.study_id, e.series_id};
            const int64_t count = slice_count_of(e, opt.slice_count_rule);
            if (!e.is_live() && opt.slice_count_rule == SliceCountRule::HalfSliceId && e.slice_id % 2 != 0) {
                record_issue(index.issues, IssueKind::MalformedSliceId,
                             "odd slice id " + std::to_string(e.slice_id) + " on stale entry for volume " +
                                 key.str() + ", counted as " + std::to_string(count),
                             entry_pos);
            }
            auto it = index.slice_counts.find(key);
            if (it == index.slice_counts.end()) {
                index.slice_counts.emplace(key, count);
            } else {
                it->second = std::max(it->second, count);
            }

            if (e.is_live()) {
                index.chunks.push_back({e.start, e.size});
            }
        }
    }
    log_info("chunk index: " + std::to_string(index.entries_seen) + " entries, " +
             std::to_string(index.chunks.size()) + " live chunks, " +
             std::to_string(index.slice_counts.size()) + " volumes");
    return index;
}

VolumeTable materialize_volumes(const ChunkIndex& index, const ReadOptions& opt) {
    VolumeTable volumes;
    for (const auto& kv : index.slice_counts) {
        int64_t n = kv.second;
        if (n <= 0) {
            if (!opt.keep_zero_slice_volumes) continue;
            n = 1;
        }
        Volume v;
        v.key = kv.first;
        v.slices.assign(static_cast<size_t>(n), Slice{EmptySlice{}});
        volumes.emplace(kv.first, std::move(v));
    }
    return volumes;
}

} // namespace e2e
