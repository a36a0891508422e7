#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "format/e2e_format.hpp"

namespace e2e {

// Field-by-field decoders for the fixed-layout records. Each takes the record's
// bytes (at least k*Bytes of them) and the file offset they were read from,
// which is only used to report TruncatedRead.
ContainerHeader parse_container_header(const std::vector<uint8_t>& bytes, uint64_t offset = 0);
DirectoryBlock parse_directory_block(const std::vector<uint8_t>& bytes, uint64_t offset = 0);
DirectoryEntry parse_directory_entry(const std::vector<uint8_t>& bytes, uint64_t offset = 0);
ChunkHeader parse_chunk_header(const std::vector<uint8_t>& bytes, uint64_t offset = 0);
ImageHeader parse_image_header(const std::vector<uint8_t>& bytes, uint64_t offset = 0);
LateralityBlock parse_laterality_block(const std::vector<uint8_t>& bytes, uint64_t offset = 0);
PatientInfo parse_patient_info(const std::vector<uint8_t>& bytes, uint64_t offset = 0);

// Fixed-length ASCII field: trailing NUL padding is dropped. Throws FormatError
// on a byte outside 7-bit ASCII.
std::string decode_padded_ascii(const uint8_t* data, size_t n, const char* field);

} // namespace e2e
