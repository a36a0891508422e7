#include "codec/pixel_decoders.hpp"

#include "format/errors.hpp"

#include <cmath>
#include <limits>
#include <string>

namespace e2e {

namespace {

static uint8_t reverse_bits8(uint8_t b) {
    b = static_cast<uint8_t>(((b & 0xF0u) >> 4) | ((b & 0x0Fu) << 4));
    b = static_cast<uint8_t>(((b & 0xCCu) >> 2) | ((b & 0x33u) << 2));
    b = static_cast<uint8_t>(((b & 0xAAu) >> 1) | ((b & 0x55u) << 1));
    return b;
}

static uint32_t reverse_bits(uint32_t v, int nbits) {
    uint32_t out = 0;
    for (int i = 0; i < nbits; ++i) {
        out = (out << 1) | ((v >> i) & 1u);
    }
    return out;
}

static size_t checked_samples(uint32_t width, uint32_t height, size_t bytes_per_sample,
                              size_t payload_bytes, const char* who) {
    const uint64_t n = static_cast<uint64_t>(width) * height;
    if (width > static_cast<uint32_t>(std::numeric_limits<int>::max()) ||
        height > static_cast<uint32_t>(std::numeric_limits<int>::max())) {
        throw FormatError(std::string(who) + ": image dimensions out of range");
    }
    if (payload_bytes < n * bytes_per_sample) {
        throw FormatError(std::string(who) + ": payload too short for " +
                          std::to_string(width) + "x" + std::to_string(height));
    }
    return static_cast<size_t>(n);
}

} // namespace

double decode_custom_float(uint8_t b0, uint8_t b1) {
    // Reverse each byte, then read the 16 bits MSB first:
    // [ mantissa (10) | exponent (6, itself stored reversed) ]
    const uint32_t bits = (static_cast<uint32_t>(reverse_bits8(b0)) << 8) | reverse_bits8(b1);
    const uint32_t mantissa = bits >> 6;
    const uint32_t exponent = reverse_bits(bits & 0x3Fu, 6);

    const double m = 1.0 + static_cast<double>(mantissa) / 1024.0;
    return std::ldexp(m, static_cast<int>(exponent) - 63);
}

Raster8 decode_planar(const std::vector<uint8_t>& payload, uint32_t width, uint32_t height) {
    const size_t n = checked_samples(width, height, 1, payload.size(), "decode_planar");
    Raster8 r;
    r.rows = static_cast<int>(height);
    r.cols = static_cast<int>(width);
    r.data.assign(payload.begin(), payload.begin() + static_cast<std::ptrdiff_t>(n));
    return r;
}

RasterF decode_custom_float_raster(const std::vector<uint8_t>& payload,
                                   uint32_t width, uint32_t height) {
    const size_t n = checked_samples(width, height, 2, payload.size(), "decode_custom_float_raster");
    RasterF r;
    r.rows = static_cast<int>(width);
    r.cols = static_cast<int>(height);
    r.data.resize(n);
    for (size_t i = 0; i < n; ++i) {
        r.data[i] = static_cast<float>(decode_custom_float(payload[2 * i], payload[2 * i + 1]));
    }
    return r;
}

void apply_gamma(RasterF& raster) {
    const double inv_gamma = 1.0 / 2.4;
    for (auto& v : raster.data) {
        v = static_cast<float>(256.0 * std::pow(static_cast<double>(v), inv_gamma));
    }
}

} // namespace e2e
