#include "container/read_options.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace e2e {

ReadOptions ReadOptions::for_mode(ReadMode mode) {
    ReadOptions o;
    if (mode == ReadMode::FundusAutofluorescence) {
        o.slice_count_rule = SliceCountRule::RawSliceId;
        o.read_laterality_records = true;
        o.reference_layout = ReferenceLayout::PerVolume;
        o.planar_laterality = PlanarLateralityPolicy::FirstPlanarImagesRight;
        o.keep_zero_slice_volumes = true;
        o.split_by_laterality = true;
    }
    return o;
}

ReadMode parse_read_mode(const std::string& s) {
    std::string v = s;
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "oct") return ReadMode::Oct;
    if (v == "faf" || v == "fundus autofluorescence") return ReadMode::FundusAutofluorescence;
    throw std::runtime_error("unknown read mode: " + s + " (expected oct or faf)");
}

} // namespace e2e
