#include "codec/pixel_decoders.hpp"
#include "format/errors.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <vector>

using namespace e2e;

TEST(CustomFloatTests, ZeroBytesIsSmallestValue) {
    EXPECT_DOUBLE_EQ(decode_custom_float(0x00, 0x00), std::ldexp(1.0, -63));
}

TEST(CustomFloatTests, AllOnesIsMaxMantissaAtUnbiasedZero) {
    EXPECT_DOUBLE_EQ(decode_custom_float(0xFF, 0xFF), 1.0 + 1023.0 / 1024.0);
}

TEST(CustomFloatTests, ExponentBitsOnlyGiveOne) {
    EXPECT_DOUBLE_EQ(decode_custom_float(0x00, 0xFC), 1.0);
}

TEST(CustomFloatTests, LowBitOfFirstByteIsMantissaMsb) {
    // bit 0 of byte 0 lands first after reversal -> mantissa 512
    EXPECT_DOUBLE_EQ(decode_custom_float(0x01, 0x00), 1.5 * std::ldexp(1.0, -63));
    // bit 1 of byte 1 is the last mantissa bit -> mantissa 1
    EXPECT_DOUBLE_EQ(decode_custom_float(0x00, 0x02), (1.0 + 1.0 / 1024.0) * std::ldexp(1.0, -63));
}

TEST(CustomFloatTests, ExponentIsHighSixBitsOfSecondByte) {
    EXPECT_DOUBLE_EQ(decode_custom_float(0x00, 0x04), std::ldexp(1.0, -62));
    EXPECT_DOUBLE_EQ(decode_custom_float(0x00, 0x80), std::ldexp(1.0, 32 - 63));
    // 0x40 = exponent 16
    EXPECT_DOUBLE_EQ(decode_custom_float(0x00, 0x40), std::ldexp(1.0, 16 - 63));
}

TEST(CustomFloatTests, MixedFields) {
    // mantissa: byte0 = 0x80 -> reversed bit position 7 -> mantissa bit value 1 << (9 - 7) = 4
    // exponent: 0xFC -> 63
    EXPECT_DOUBLE_EQ(decode_custom_float(0x80, 0xFC), 1.0 + 4.0 / 1024.0);
}

TEST(PlanarDecoderTests, ReshapesHeightRowsByWidthCols) {
    const std::vector<uint8_t> px = {1, 2, 3, 4, 5, 6};
    const Raster8 r = decode_planar(px, 3, 2);
    EXPECT_EQ(r.rows, 2);
    EXPECT_EQ(r.cols, 3);
    EXPECT_EQ(r.at(0, 0), 1);
    EXPECT_EQ(r.at(0, 2), 3);
    EXPECT_EQ(r.at(1, 0), 4);
    EXPECT_EQ(r.at(1, 2), 6);
}

TEST(PlanarDecoderTests, ShortPayloadThrows) {
    const std::vector<uint8_t> px(5, 0);
    EXPECT_THROW(decode_planar(px, 3, 2), FormatError);
}

TEST(PlanarDecoderTests, OversizedWidthWithZeroHeightThrows) {
    const std::vector<uint8_t> px;
    EXPECT_THROW(decode_planar(px, 0x80000000u, 0), FormatError);
}

TEST(CustomFloatRasterTests, ReshapesWidthRowsByHeightCols) {
    // width 2, height 3; sample 1 is the smallest value, the rest are 1.0
    std::vector<uint8_t> px;
    for (int i = 0; i < 6; ++i) {
        px.push_back(0x00);
        px.push_back(i == 1 ? 0x00 : 0xFC);
    }
    const RasterF r = decode_custom_float_raster(px, 2, 3);
    EXPECT_EQ(r.rows, 2);
    EXPECT_EQ(r.cols, 3);
    EXPECT_FLOAT_EQ(r.at(0, 0), 1.0f);
    EXPECT_FLOAT_EQ(r.at(0, 1), static_cast<float>(std::ldexp(1.0, -63)));
    EXPECT_FLOAT_EQ(r.at(1, 2), 1.0f);
}

TEST(CustomFloatRasterTests, ShortPayloadThrows) {
    const std::vector<uint8_t> px(7, 0);
    EXPECT_THROW(decode_custom_float_raster(px, 2, 2), FormatError);
}

TEST(CustomFloatRasterTests, OversizedHeightWithZeroWidthThrows) {
    const std::vector<uint8_t> px;
    EXPECT_THROW(decode_custom_float_raster(px, 0, 0x80000000u), FormatError);
}

TEST(GammaTests, UniformOneBecomes256) {
    RasterF r;
    r.rows = 4;
    r.cols = 5;
    r.data.assign(20, static_cast<float>(decode_custom_float(0x00, 0xFC)));
    apply_gamma(r);
    for (float v : r.data) EXPECT_FLOAT_EQ(v, 256.0f);
}

TEST(GammaTests, FollowsPowerLaw) {
    RasterF r;
    r.rows = 1;
    r.cols = 2;
    r.data = {0.0f, 0.5f};
    apply_gamma(r);
    EXPECT_FLOAT_EQ(r.data[0], 0.0f);
    EXPECT_NEAR(r.data[1], 256.0 * std::pow(0.5, 1.0 / 2.4), 1e-3);
}
