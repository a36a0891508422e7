#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace e2e {

// Export-side 8-bit grayscale image, row-major.
struct Image {
    int width = 0;
    int height = 0;
    std::vector<int32_t> pixels;
};

// Row-major 2-D grid.
template <typename T>
struct Raster {
    int rows = 0;
    int cols = 0;
    std::vector<T> data;

    T at(int r, int c) const { return data[static_cast<size_t>(r) * cols + c]; }
    size_t size() const { return data.size(); }
    bool empty() const { return data.empty(); }
};

using Raster8 = Raster<uint8_t>;
using RasterF = Raster<float>;

enum class Laterality : uint8_t {
    Right,
    Left,
};

inline char laterality_code(Laterality l) { return l == Laterality::Right ? 'R' : 'L'; }

// (patient, study, series) identity of a volume.
struct VolumeKey {
    uint32_t patient_id = 0;
    uint32_t study_id = 0;
    uint32_t series_id = 0;

    std::string str() const {
        return std::to_string(patient_id) + "_" + std::to_string(study_id) + "_" +
               std::to_string(series_id);
    }
    bool operator<(const VolumeKey& o) const {
        if (patient_id != o.patient_id) return patient_id < o.patient_id;
        if (study_id != o.study_id) return study_id < o.study_id;
        return series_id < o.series_id;
    }
    bool operator==(const VolumeKey& o) const {
        return patient_id == o.patient_id && study_id == o.study_id && series_id == o.series_id;
    }
};

// Slot contents of a volume's slice array.
struct EmptySlice {};

struct PlanarSlice {
    std::optional<Laterality> laterality;
    Raster8 raster;
};

struct VolumetricSlice {
    RasterF raster;           // gamma-corrected intensities
};

using Slice = std::variant<EmptySlice, PlanarSlice, VolumetricSlice>;

inline bool is_empty(const Slice& s) { return std::holds_alternative<EmptySlice>(s); }

struct Volume {
    VolumeKey key;
    std::optional<Laterality> laterality;
    std::vector<Slice> slices;

    std::string patient_key() const { return key.str(); }
    size_t populated() const {
        size_t n = 0;
        for (const auto& s : slices) n += is_empty(s) ? 0 : 1;
        return n;
    }
};

// 2-D fundus / reference image.
struct ReferenceImage {
    VolumeKey key;
    std::optional<Laterality> laterality;
    Raster8 raster;
};

} // namespace e2e
