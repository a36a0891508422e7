#include "io/byte_source.hpp"

#include "format/errors.hpp"

#include <string>

namespace e2e {

ByteSource::ByteSource(std::istream& is) : is_(is) {
    is_.clear();
    is_.seekg(0, std::ios::end);
    const std::streamoff end = is_.tellg();
    if (!is_ || end < 0) throw std::runtime_error("byte source: stream is not seekable");
    length_ = static_cast<uint64_t>(end);
    is_.seekg(0, std::ios::beg);
}

void ByteSource::seek(uint64_t offset) {
    // A previous short read leaves eof/fail set.
    is_.clear();
    pos_ = offset;
    if (offset <= length_) is_.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
}

std::vector<uint8_t> ByteSource::read(size_t n, const char* what) {
    // Checked before allocating: sizes come from untrusted headers.
    if (pos_ > length_ || n > length_ - pos_) {
        throw TruncatedRead(what, pos_, n, pos_ > length_ ? 0 : static_cast<size_t>(length_ - pos_));
    }
    std::vector<uint8_t> buf(n);
    if (n == 0) return buf;
    is_.read(reinterpret_cast<char*>(buf.data()), static_cast<std::streamsize>(n));
    const auto got = static_cast<size_t>(is_.gcount());
    if (got != n) {
        throw TruncatedRead(what, pos_, n, got);
    }
    pos_ += n;
    return buf;
}

} // namespace e2e
