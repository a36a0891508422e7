#pragma once
#include <gtest/gtest.h>

#include "format/byte_io.hpp"
#include "format/e2e_format.hpp"
#include "io/image_types.hpp"

#include <cstdint>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace e2e_test {

using e2e::ByteWriter;
using e2e::VolumeKey;

// Custom-float sample bytes for 1.0 (mantissa 0, exponent 63).
inline constexpr uint8_t kOneLo = 0x00;
inline constexpr uint8_t kOneHi = 0xFC;

inline std::vector<uint8_t> uniform_float_pixels(uint32_t width, uint32_t height,
                                                 uint8_t lo = kOneLo, uint8_t hi = kOneHi) {
    std::vector<uint8_t> px;
    px.reserve(static_cast<size_t>(width) * height * 2);
    for (size_t i = 0; i < static_cast<size_t>(width) * height; ++i) {
        px.push_back(lo);
        px.push_back(hi);
    }
    return px;
}

inline std::vector<uint8_t> ramp_pixels(uint32_t width, uint32_t height) {
    std::vector<uint8_t> px(static_cast<size_t>(width) * height);
    for (size_t i = 0; i < px.size(); ++i) px[i] = static_cast<uint8_t>(i & 0xFF);
    return px;
}

inline void write_directory_block(ByteWriter& w, uint32_t num_entries, uint32_t current, uint32_t prev) {
    w.write_fixed_string("MDbMDbMDb", e2e::kMagicBytes);
    w.write_u32_le(100);
    w.write_zeros(20);
    w.write_u32_le(num_entries);
    w.write_u32_le(current);
    w.write_u32_le(prev);
    w.write_u32_le(0);
}

inline void write_chunk_header(ByteWriter& w, const VolumeKey& key, int32_t slice_id, uint16_t ind,
                               uint32_t type, uint32_t size) {
    w.write_fixed_string("MDbData", e2e::kMagicBytes);
    w.write_u32_le(0);
    w.write_u32_le(0);
    w.write_u32_le(0);        // pos
    w.write_u32_le(size);
    w.write_u32_le(0);
    w.write_u32_le(key.patient_id);
    w.write_u32_le(key.study_id);
    w.write_u32_le(key.series_id);
    w.write_i32_le(slice_id);
    w.write_u16_le(ind);
    w.write_u16_le(0);
    w.write_u32_le(type);
    w.write_u32_le(0);
}

// Builds an in-memory container:
//   [header][main block][block 0][entries]...[block N][entries][chunks...]
// main.current points at the last block; each block's prev points at the one
// before it, so the walk visits blocks newest first.
class ContainerBuilder {
public:
    ContainerBuilder() { new_block(); }

    // Subsequent entries go into a fresh directory block.
    ContainerBuilder& new_block() {
        blocks_.emplace_back();
        return *this;
    }

    ContainerBuilder& image(const VolumeKey& key, int32_t slice_id, uint16_t ind, uint32_t width,
                            uint32_t height, const std::vector<uint8_t>& pixels) {
        ByteWriter w;
        const uint32_t payload = static_cast<uint32_t>(e2e::kImageHeaderBytes + pixels.size());
        write_chunk_header(w, key, slice_id, ind, e2e::kChunkTypeImage, payload);
        w.write_u32_le(static_cast<uint32_t>(pixels.size()));
        w.write_u32_le(0x02010201);
        w.write_u32_le(0);
        w.write_u32_le(width);
        w.write_u32_le(height);
        w.write_bytes(pixels.data(), pixels.size());
        return chunk(key, slice_id, e2e::kChunkTypeImage, w.bytes());
    }

    ContainerBuilder& volumetric(const VolumeKey& key, int32_t slice_id, uint32_t width, uint32_t height) {
        return image(key, slice_id, e2e::kImageVolumetric, width, height, uniform_float_pixels(width, height));
    }

    ContainerBuilder& planar(const VolumeKey& key, int32_t slice_id, uint32_t width, uint32_t height) {
        return image(key, slice_id, e2e::kImagePlanar, width, height, ramp_pixels(width, height));
    }

    ContainerBuilder& laterality(const VolumeKey& key, uint8_t code, const std::string& text = "") {
        ByteWriter w;
        write_chunk_header(w, key, 0, 0, e2e::kChunkTypeLaterality, e2e::kLateralityBytes);
        w.write_fixed_string(text, 14);
        w.write_u8(code);
        w.write_u8(0);
        return chunk(key, 0, e2e::kChunkTypeLaterality, w.bytes());
    }

    ContainerBuilder& laterality_raw(const VolumeKey& key, const std::vector<uint8_t>& payload) {
        ByteWriter w;
        write_chunk_header(w, key, 0, 0, e2e::kChunkTypeLaterality, static_cast<uint32_t>(payload.size()));
        w.write_bytes(payload.data(), payload.size());
        return chunk(key, 0, e2e::kChunkTypeLaterality, w.bytes());
    }

    ContainerBuilder& patient(const VolumeKey& key, const std::string& name, const std::string& surname,
                              uint32_t birthdate, uint8_t sex) {
        ByteWriter w;
        write_chunk_header(w, key, 0, 0, e2e::kChunkTypePatientInfo, e2e::kPatientInfoBytes);
        w.write_fixed_string(name, 31);
        w.write_fixed_string(surname, 66);
        w.write_u32_le(birthdate);
        w.write_u8(sex);
        return chunk(key, 0, e2e::kChunkTypePatientInfo, w.bytes());
    }

    // Chunk with an arbitrary type tag and no payload we decode.
    ContainerBuilder& opaque(const VolumeKey& key, int32_t slice_id, uint32_t type) {
        ByteWriter w;
        write_chunk_header(w, key, slice_id, 0, type, 8);
        w.write_zeros(8);
        return chunk(key, slice_id, type, w.bytes());
    }

    // Directory entry with no live chunk behind it (start <= pos).
    ContainerBuilder& stale_entry(const VolumeKey& key, int32_t slice_id) {
        blocks_.back().push_back(Entry{key, slice_id, 0, -1});
        return *this;
    }

    // Points main.current at nothing: the chain is empty.
    ContainerBuilder& detach_chain() {
        detached_ = true;
        return *this;
    }

    std::string build() const {
        // layout
        std::vector<uint32_t> block_pos;
        uint32_t off = static_cast<uint32_t>(e2e::kHeaderBytes + e2e::kDirectoryBlockBytes);
        size_t total_entries = 0;
        for (const auto& b : blocks_) {
            block_pos.push_back(off);
            off += static_cast<uint32_t>(e2e::kDirectoryBlockBytes + b.size() * e2e::kDirectoryEntryBytes);
            total_entries += b.size();
        }
        std::vector<uint32_t> chunk_pos;
        for (const auto& c : chunks_) {
            chunk_pos.push_back(off);
            off += static_cast<uint32_t>(c.size());
        }

        ByteWriter w;
        w.write_fixed_string("CMDb", e2e::kMagicBytes);
        w.write_u32_le(100);
        w.write_zeros(20);
        write_directory_block(w, static_cast<uint32_t>(total_entries),
                              detached_ ? 0 : block_pos.back(), 0);

        for (size_t b = 0; b < blocks_.size(); ++b) {
            write_directory_block(w, static_cast<uint32_t>(blocks_[b].size()), 0,
                                  b == 0 ? 0 : block_pos[b - 1]);
            for (const auto& e : blocks_[b]) {
                const uint32_t pos = static_cast<uint32_t>(w.size());
                const bool live = e.chunk >= 0;
                w.write_u32_le(pos);
                w.write_u32_le(live ? chunk_pos[static_cast<size_t>(e.chunk)] : 0);
                w.write_u32_le(live ? static_cast<uint32_t>(chunks_[static_cast<size_t>(e.chunk)].size()) : 0);
                w.write_u32_le(0);
                w.write_u32_le(e.key.patient_id);
                w.write_u32_le(e.key.study_id);
                w.write_u32_le(e.key.series_id);
                w.write_i32_le(e.slice_id);
                w.write_u16_le(0);
                w.write_u16_le(0);
                w.write_u32_le(e.type);
                w.write_u32_le(0);
            }
        }
        for (const auto& c : chunks_) w.write_bytes(c.data(), c.size());
        return std::string(w.bytes().begin(), w.bytes().end());
    }

    // Offset of the i-th chunk in the built container.
    uint32_t chunk_offset(size_t i) const {
        uint32_t off = static_cast<uint32_t>(e2e::kHeaderBytes + e2e::kDirectoryBlockBytes);
        for (const auto& b : blocks_) {
            off += static_cast<uint32_t>(e2e::kDirectoryBlockBytes + b.size() * e2e::kDirectoryEntryBytes);
        }
        for (size_t k = 0; k < i; ++k) off += static_cast<uint32_t>(chunks_[k].size());
        return off;
    }

private:
    struct Entry {
        VolumeKey key;
        int32_t slice_id;
        uint32_t type;
        int chunk;            // index into chunks_, -1 = stale
    };

    ContainerBuilder& chunk(const VolumeKey& key, int32_t slice_id, uint32_t type,
                            const std::vector<uint8_t>& bytes) {
        chunks_.push_back(bytes);
        blocks_.back().push_back(Entry{key, slice_id, type, static_cast<int>(chunks_.size() - 1)});
        return *this;
    }

    std::vector<std::vector<Entry>> blocks_;
    std::vector<std::vector<uint8_t>> chunks_;
    bool detached_ = false;
};

} // namespace e2e_test
