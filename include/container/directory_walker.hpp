#pragma once

#include <cstdint>
#include <vector>

#include "format/e2e_format.hpp"
#include "io/byte_source.hpp"

namespace e2e {

struct DirectoryChain {
    ContainerHeader header;
    DirectoryBlock main;              // block right after the header
    std::vector<uint32_t> offsets;    // chain reached via main.current, then prev
};

// Reads the header and first directory block from offset 0, then follows
// current -> prev -> ... -> 0. The first block's own position is not part of
// `offsets`. Throws TruncatedRead on a short read, FormatError when the chain
// revisits an offset or grows beyond max_blocks.
DirectoryChain walk_directory_chain(ByteSource& src, size_t max_blocks);

} // namespace e2e
