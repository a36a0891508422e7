#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

#include "format/errors.hpp"

namespace e2e {

// Little-endian writer. The reader never needs it; tests and tools use it to
// build containers.
class ByteWriter {
public:
    void write_u8(uint8_t v) { buf_.push_back(v); }
    void write_u16_le(uint16_t v) {
        buf_.push_back(static_cast<uint8_t>(v & 0xFF));
        buf_.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    }
    void write_u32_le(uint32_t v) {
        write_u16_le(static_cast<uint16_t>(v & 0xFFFF));
        write_u16_le(static_cast<uint16_t>((v >> 16) & 0xFFFF));
    }
    void write_i32_le(int32_t v) { write_u32_le(static_cast<uint32_t>(v)); }
    void write_bytes(const void* p, size_t n) {
        const uint8_t* b = static_cast<const uint8_t*>(p);
        buf_.insert(buf_.end(), b, b + n);
    }
    // Writes s truncated or NUL-padded to exactly n bytes.
    void write_fixed_string(const std::string& s, size_t n) {
        for (size_t i = 0; i < n; ++i) {
            write_u8(i < s.size() ? static_cast<uint8_t>(s[i]) : 0);
        }
    }
    void write_zeros(size_t n) { buf_.insert(buf_.end(), n, 0); }

    size_t size() const { return buf_.size(); }
    const std::vector<uint8_t>& bytes() const { return buf_; }
    std::vector<uint8_t>& bytes() { return buf_; }

private:
    std::vector<uint8_t> buf_;
};

// Little-endian cursor over one record's bytes. Every read is bounds checked
// and reports TruncatedRead against the record's file offset.
class ByteReader {
public:
    ByteReader(const std::vector<uint8_t>& data, const char* record, uint64_t base_offset = 0)
        : buf_(data), record_(record), base_(base_offset) {}

    uint8_t read_u8() {
        need(1);
        return buf_[pos_++];
    }
    uint16_t read_u16_le() {
        need(2);
        uint16_t lo = read_u8();
        uint16_t hi = read_u8();
        return static_cast<uint16_t>(lo | (hi << 8));
    }
    uint32_t read_u32_le() {
        need(4);
        uint32_t a = read_u16_le();
        uint32_t b = read_u16_le();
        return a | (b << 16);
    }
    int32_t read_i32_le() { return static_cast<int32_t>(read_u32_le()); }
    void read_bytes(void* out, size_t n) {
        need(n);
        std::memcpy(out, buf_.data() + pos_, n);
        pos_ += n;
    }
    void skip(size_t n) {
        need(n);
        pos_ += n;
    }

private:
    void need(size_t n) {
        if (pos_ + n > buf_.size()) {
            throw TruncatedRead(record_, base_ + pos_, n, buf_.size() - pos_);
        }
    }

    const std::vector<uint8_t>& buf_;
    const char* record_;
    uint64_t base_;
    size_t pos_ = 0;
};

} // namespace e2e
