#pragma once

#include <cstdint>
#include <vector>

#include "io/image_types.hpp"

namespace e2e {

// Custom unsigned 16-bit float: 10-bit mantissa, 6-bit exponent (bias 63),
// stored with the bit order of each byte reversed.
//   value = (1 + mantissa / 1024) * 2^(exponent - 63)
double decode_custom_float(uint8_t b0, uint8_t b1);

// Both raster decoders throw FormatError when a dimension exceeds INT_MAX or
// the payload holds fewer than width * height samples.

// Planar 8-bit raster, `height` rows of `width` samples.
Raster8 decode_planar(const std::vector<uint8_t>& payload, uint32_t width, uint32_t height);

// Volumetric raster of custom floats, laid out as `width` rows of `height`
// samples. Values are raw (no gamma).
RasterF decode_custom_float_raster(const std::vector<uint8_t>& payload,
                                   uint32_t width, uint32_t height);

// In place: v = 256 * v^(1/2.4)
void apply_gamma(RasterF& raster);

} // namespace e2e
