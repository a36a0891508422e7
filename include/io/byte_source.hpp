#pragma once

#include <cstdint>
#include <istream>
#include <vector>

namespace e2e {

// Random-access reads over a seekable stream. One ByteSource owns the cursor
// for a whole decode; it is not shared between threads.
class ByteSource {
public:
    // Measures the stream length; the stream must support seekg/tellg.
    explicit ByteSource(std::istream& is);

    void seek(uint64_t offset);
    uint64_t tell() const { return pos_; }
    uint64_t length() const { return length_; }

    // Reads exactly n bytes at the cursor, throws TruncatedRead otherwise.
    std::vector<uint8_t> read(size_t n, const char* what);
    std::vector<uint8_t> read_at(uint64_t offset, size_t n, const char* what) {
        seek(offset);
        return read(n, what);
    }

private:
    std::istream& is_;
    uint64_t pos_ = 0;
    uint64_t length_ = 0;
};

} // namespace e2e
