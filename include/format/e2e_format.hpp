#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace e2e {

// IMPORTANT:
// Do NOT read these structs by dumping raw memory or using sizeof().
// Struct padding/alignment is compiler-dependent. Always decode field-by-field
// (see format/records.hpp).
inline constexpr size_t kHeaderBytes = 36;
inline constexpr size_t kDirectoryBlockBytes = 52;
inline constexpr size_t kDirectoryEntryBytes = 44;
inline constexpr size_t kChunkHeaderBytes = 60;
inline constexpr size_t kImageHeaderBytes = 20;
inline constexpr size_t kLateralityBytes = 16;
inline constexpr size_t kPatientInfoBytes = 102;

inline constexpr size_t kMagicBytes = 12;

// Chunk type tags.
inline constexpr uint32_t kChunkTypePatientInfo = 9;
inline constexpr uint32_t kChunkTypeLaterality = 11;
inline constexpr uint32_t kChunkTypeImage = 1073741824; // 0x40000000

// Image chunk sub-kinds (ChunkHeader::ind).
inline constexpr uint16_t kImagePlanar = 0;
inline constexpr uint16_t kImageVolumetric = 1;

inline constexpr uint8_t kLateralityRight = 82; // 'R'
inline constexpr uint8_t kLateralityLeft = 76;  // 'L'

// Container layout:
// [Header][DirectoryBlock]...[DirectoryBlock][entries...]...[ChunkHeader][payload]...
//
// Directory blocks form a singly linked list through `prev`, entered through
// the first block's `current`. All integers are little-endian.

struct ContainerHeader {
    std::string magic;        // 12 bytes ascii, NUL padded
    uint32_t version = 0;
    uint16_t reserved[10] = {};
};

struct DirectoryBlock {
    std::string magic;
    uint32_t version = 0;
    uint16_t reserved[10] = {};
    uint32_t num_entries = 0;
    uint32_t current = 0;     // head of the chain (first block only)
    uint32_t prev = 0;        // previous block, 0 = end of chain
    uint32_t reserved2 = 0;
};

struct DirectoryEntry {
    uint32_t pos = 0;
    uint32_t start = 0;       // live when start > pos
    uint32_t size = 0;
    uint32_t reserved = 0;
    uint32_t patient_id = 0;
    uint32_t study_id = 0;
    uint32_t series_id = 0;
    int32_t slice_id = 0;     // even; slice index = slice_id / 2, 1-based
    uint16_t reserved2 = 0;
    uint16_t reserved3 = 0;
    uint32_t type = 0;
    uint32_t reserved4 = 0;

    bool is_live() const { return start > pos; }
};

struct ChunkHeader {
    std::string magic;
    uint32_t reserved = 0;
    uint32_t reserved2 = 0;
    uint32_t pos = 0;
    uint32_t size = 0;
    uint32_t reserved3 = 0;
    uint32_t patient_id = 0;
    uint32_t study_id = 0;
    uint32_t series_id = 0;
    int32_t slice_id = 0;
    uint16_t ind = 0;         // 0 = planar image, 1 = volumetric slice
    uint16_t reserved4 = 0;
    uint32_t type = 0;
    uint32_t reserved5 = 0;
};

struct ImageHeader {
    uint32_t size = 0;
    uint32_t type = 0;
    uint32_t reserved = 0;
    uint32_t width = 0;
    uint32_t height = 0;
};

struct LateralityBlock {
    uint8_t reserved[14] = {};
    uint8_t laterality = 0;   // 'R' or 'L'
    uint8_t reserved2 = 0;
};

struct PatientInfo {
    std::string name;         // 31 bytes ascii
    std::string surname;      // 66 bytes ascii
    uint32_t birthdate = 0;
    uint8_t sex = 0;
};

} // namespace e2e
