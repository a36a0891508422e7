#pragma once

#include <cstddef>
#include <string>

namespace e2e {

enum class ReadMode {
    Oct,                      // volumetric OCT scans
    FundusAutofluorescence,   // single-image planar series
};

// How a volume's slice count is derived from its directory entries.
enum class SliceCountRule {
    HalfSliceId,              // max(slice_id / 2)
    RawSliceId,               // max(slice_id)
};

enum class ReferenceLayout {
    List,                     // every planar image, in dispatch order
    PerVolume,                // one image per volume key, also placed in the volume
};

// Which eye a planar image is attributed to.
enum class PlanarLateralityPolicy {
    FromRecord,               // last laterality record seen
    FirstPlanarImagesRight,   // first right_eye_planar_count images R, the rest L
};

struct ReadOptions {
    SliceCountRule slice_count_rule = SliceCountRule::HalfSliceId;
    bool read_laterality_records = false;
    bool read_patient_records = true;
    ReferenceLayout reference_layout = ReferenceLayout::List;
    PlanarLateralityPolicy planar_laterality = PlanarLateralityPolicy::FromRecord;
    size_t right_eye_planar_count = 2;
    // Volumes with a slice count of 0 still get one slot.
    bool keep_zero_slice_volumes = false;
    // One output entity per populated slot instead of one per volume.
    bool split_by_laterality = false;
    // Upper bound on directory blocks; guards against cyclic chains.
    size_t max_directory_chain = 65536;

    static ReadOptions for_mode(ReadMode mode);
};

// "oct" / "faf"; throws std::runtime_error otherwise.
ReadMode parse_read_mode(const std::string& s);

} // namespace e2e
