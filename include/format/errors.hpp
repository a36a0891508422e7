#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace e2e {

// Container is structurally unusable (bad chain, impossible sizes, ...).
class FormatError : public std::runtime_error {
public:
    explicit FormatError(const std::string& what) : std::runtime_error(what) {}
};

// Fewer bytes were available than a record or payload requires.
class TruncatedRead : public FormatError {
public:
    TruncatedRead(const std::string& where, uint64_t offset, size_t wanted, size_t got)
        : FormatError(where + ": truncated read at offset " + std::to_string(offset) +
                      " (wanted " + std::to_string(wanted) + " bytes, got " +
                      std::to_string(got) + ")"),
          offset_(offset), wanted_(wanted), got_(got) {}

    uint64_t offset() const { return offset_; }
    size_t wanted() const { return wanted_; }
    size_t got() const { return got_; }

private:
    uint64_t offset_;
    size_t wanted_;
    size_t got_;
};

} // namespace e2e
