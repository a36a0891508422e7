#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "container/chunk_index.hpp"
#include "container/decode_result.hpp"
#include "container/read_options.hpp"
#include "format/e2e_format.hpp"
#include "io/byte_source.hpp"
#include "io/image_types.hpp"

namespace e2e {

// Carried from one chunk to the next, in dispatch order.
struct DispatchState {
    std::optional<Laterality> laterality;   // last laterality record
    size_t planar_seen = 0;                 // planar images dispatched so far
};

// Laterality a planar image is filed under; advances state.planar_seen.
std::optional<Laterality> next_planar_laterality(DispatchState& state, const ReadOptions& opt);

// Maps a laterality record byte ('R' / 'L') to a laterality, nullopt otherwise.
std::optional<Laterality> laterality_from_code(uint8_t code);

class ChunkDispatcher {
public:
    ChunkDispatcher(ByteSource& src, const ReadOptions& opt, VolumeTable& volumes, DecodeResult& out)
        : src_(src), opt_(opt), volumes_(volumes), out_(out) {}

    // Decodes one chunk. Recoverable problems are recorded in the result;
    // TruncatedRead propagates.
    void dispatch(const ChunkLocation& loc, DispatchState& state);

private:
    void on_laterality(const ChunkLocation& loc, DispatchState& state);
    void on_patient_info(const ChunkLocation& loc, const ChunkHeader& chunk);
    void on_image(const ChunkLocation& loc, const ChunkHeader& chunk, DispatchState& state);
    void on_planar(const ChunkLocation& loc, const ChunkHeader& chunk, const ImageHeader& img,
                   DispatchState& state);
    void on_volumetric(const ChunkLocation& loc, const ChunkHeader& chunk, const ImageHeader& img,
                       const DispatchState& state);

    // Volume and slot for the chunk, or nullptr after recording why not.
    Volume* find_volume(const ChunkLocation& loc, const ChunkHeader& chunk);
    Slice* find_slot(const ChunkLocation& loc, const ChunkHeader& chunk, Volume& volume);

    ByteSource& src_;
    const ReadOptions& opt_;
    VolumeTable& volumes_;
    DecodeResult& out_;
};

// Runs every chunk in order. A truncated read stops the loop and marks the
// result incomplete; everything decoded up to that point is kept.
void dispatch_chunks(ByteSource& src, std::vector<ChunkLocation> chunks, const ReadOptions& opt,
                     VolumeTable& volumes, DecodeResult& out);

} // namespace e2e
