#pragma once

#include <vector>

#include "container/chunk_index.hpp"
#include "container/decode_result.hpp"
#include "container/read_options.hpp"
#include "io/image_types.hpp"

namespace e2e {

// Moves the filled slice arrays into the output collection. With
// split_by_laterality every populated slot becomes its own single-slice volume
// tagged with the slot's laterality; otherwise one volume per key. Volumes
// (or slots) without image data are left out and reported.
std::vector<Volume> assemble_volumes(VolumeTable&& volumes, const ReadOptions& opt,
                                     std::vector<DecodeIssue>& issues);

} // namespace e2e
