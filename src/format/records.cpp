#include "format/records.hpp"

#include "format/byte_io.hpp"
#include "format/errors.hpp"

namespace e2e {

namespace {

static void require_size(const std::vector<uint8_t>& bytes, size_t want,
                         const char* record, uint64_t offset) {
    if (bytes.size() < want) throw TruncatedRead(record, offset, want, bytes.size());
}

// Magic strings are consumed, never validated: keep whatever bytes are there.
static std::string read_magic(ByteReader& r) {
    char raw[kMagicBytes];
    r.read_bytes(raw, kMagicBytes);
    size_t n = kMagicBytes;
    while (n > 0 && raw[n - 1] == '\0') --n;
    return std::string(raw, n);
}

static void read_u16_array(ByteReader& r, uint16_t* out, size_t n) {
    for (size_t i = 0; i < n; ++i) out[i] = r.read_u16_le();
}

} // namespace

std::string decode_padded_ascii(const uint8_t* data, size_t n, const char* field) {
    size_t len = n;
    while (len > 0 && data[len - 1] == 0) --len;
    std::string s;
    s.reserve(len);
    for (size_t i = 0; i < len; ++i) {
        if (data[i] > 0x7F) {
            throw FormatError(std::string("records: non-ASCII byte in ") + field +
                              " at index " + std::to_string(i));
        }
        s.push_back(static_cast<char>(data[i]));
    }
    return s;
}

ContainerHeader parse_container_header(const std::vector<uint8_t>& bytes, uint64_t offset) {
    require_size(bytes, kHeaderBytes, "records: header", offset);
    ByteReader r(bytes, "records: header", offset);
    ContainerHeader h;
    h.magic = read_magic(r);
    h.version = r.read_u32_le();
    read_u16_array(r, h.reserved, 10);
    return h;
}

DirectoryBlock parse_directory_block(const std::vector<uint8_t>& bytes, uint64_t offset) {
    require_size(bytes, kDirectoryBlockBytes, "records: directory block", offset);
    ByteReader r(bytes, "records: directory block", offset);
    DirectoryBlock d;
    d.magic = read_magic(r);
    d.version = r.read_u32_le();
    read_u16_array(r, d.reserved, 10);
    d.num_entries = r.read_u32_le();
    d.current = r.read_u32_le();
    d.prev = r.read_u32_le();
    d.reserved2 = r.read_u32_le();
    return d;
}

DirectoryEntry parse_directory_entry(const std::vector<uint8_t>& bytes, uint64_t offset) {
    require_size(bytes, kDirectoryEntryBytes, "records: directory entry", offset);
    ByteReader r(bytes, "records: directory entry", offset);
    DirectoryEntry e;
    e.pos = r.read_u32_le();
    e.start = r.read_u32_le();
    e.size = r.read_u32_le();
    e.reserved = r.read_u32_le();
    e.patient_id = r.read_u32_le();
    e.study_id = r.read_u32_le();
    e.series_id = r.read_u32_le();
    e.slice_id = r.read_i32_le();
    e.reserved2 = r.read_u16_le();
    e.reserved3 = r.read_u16_le();
    e.type = r.read_u32_le();
    e.reserved4 = r.read_u32_le();
    return e;
}

ChunkHeader parse_chunk_header(const std::vector<uint8_t>& bytes, uint64_t offset) {
    require_size(bytes, kChunkHeaderBytes, "records: chunk header", offset);
    ByteReader r(bytes, "records: chunk header", offset);
    ChunkHeader c;
    c.magic = read_magic(r);
    c.reserved = r.read_u32_le();
    c.reserved2 = r.read_u32_le();
    c.pos = r.read_u32_le();
    c.size = r.read_u32_le();
    c.reserved3 = r.read_u32_le();
    c.patient_id = r.read_u32_le();
    c.study_id = r.read_u32_le();
    c.series_id = r.read_u32_le();
    c.slice_id = r.read_i32_le();
    c.ind = r.read_u16_le();
    c.reserved4 = r.read_u16_le();
    c.type = r.read_u32_le();
    c.reserved5 = r.read_u32_le();
    return c;
}

ImageHeader parse_image_header(const std::vector<uint8_t>& bytes, uint64_t offset) {
    require_size(bytes, kImageHeaderBytes, "records: image header", offset);
    ByteReader r(bytes, "records: image header", offset);
    ImageHeader h;
    h.size = r.read_u32_le();
    h.type = r.read_u32_le();
    h.reserved = r.read_u32_le();
    h.width = r.read_u32_le();
    h.height = r.read_u32_le();
    return h;
}

LateralityBlock parse_laterality_block(const std::vector<uint8_t>& bytes, uint64_t offset) {
    require_size(bytes, kLateralityBytes, "records: laterality", offset);
    ByteReader r(bytes, "records: laterality", offset);
    LateralityBlock l;
    r.read_bytes(l.reserved, sizeof(l.reserved));
    // The leading field is a padded text field; anything else means this is
    // not a laterality record.
    decode_padded_ascii(l.reserved, sizeof(l.reserved), "laterality text");
    l.laterality = r.read_u8();
    l.reserved2 = r.read_u8();
    return l;
}

PatientInfo parse_patient_info(const std::vector<uint8_t>& bytes, uint64_t offset) {
    require_size(bytes, kPatientInfoBytes, "records: patient info", offset);
    PatientInfo p;
    p.name = decode_padded_ascii(bytes.data(), 31, "patient name");
    p.surname = decode_padded_ascii(bytes.data() + 31, 66, "patient surname");
    ByteReader r(bytes, "records: patient info", offset);
    r.skip(31 + 66);
    p.birthdate = r.read_u32_le();
    p.sex = r.read_u8();
    return p;
}

} // namespace e2e
