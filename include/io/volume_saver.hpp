#pragma once

#include <string>
#include <vector>

#include "io/image_types.hpp"

namespace e2e {

// 8-bit PGM (P5).
void save_pgm(const std::string& path, const Image& im);

// 8-bit export images. Volumetric intensities are clamped to [0, 255].
Image to_image(const Raster8& raster);
Image to_image(const RasterF& raster);
// Throws for EmptySlice.
Image to_image(const Slice& slice);

// One PGM per populated slice: <dir>/<volume_stem(volume, n)>_<slot>.pgm.
// `n` is the volume's position in the decode result, which keeps split
// single-slice entities of one key and eye apart. Returns the paths written.
std::vector<std::string> save_volume_pgm(const std::string& dir, const Volume& volume, size_t n);

// Multi-frame secondary-capture DICOM (MONOCHROME2, 8-bit), one frame per
// populated slice. All frames must share the same dimensions.
void save_volume_dicom(const std::string& path, const Volume& volume);
void save_reference_dicom(const std::string& path, const ReferenceImage& image);

// <key>[_<R|L>], used for output file names.
std::string output_stem(const VolumeKey& key, const std::optional<Laterality>& laterality);
// <key>[_<R|L>]_<n>
std::string volume_stem(const Volume& volume, size_t n);

} // namespace e2e
