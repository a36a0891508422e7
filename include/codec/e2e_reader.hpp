#pragma once

#include <istream>
#include <string>

#include "container/decode_result.hpp"
#include "container/read_options.hpp"

namespace e2e {

// Decode a container from a seekable stream. Throws TruncatedRead or
// FormatError when the header or directory chain cannot be read; chunk-level
// problems end up in DecodeResult::issues.
DecodeResult read_e2e(std::istream& is, const ReadOptions& opt = ReadOptions{});

// Opens `path` for the duration of the call.
DecodeResult read_e2e(const std::string& path, const ReadOptions& opt = ReadOptions{});

} // namespace e2e
