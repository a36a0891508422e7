#include "container/directory_walker.hpp"

#include "format/errors.hpp"
#include "format/records.hpp"
#include "util/log.hpp"

#include <string>
#include <unordered_set>

namespace e2e {

DirectoryChain walk_directory_chain(ByteSource& src, size_t max_blocks) {
    DirectoryChain chain;

    src.seek(0);
    chain.header = parse_container_header(src.read(kHeaderBytes, "walker: header"), 0);

    const uint64_t main_pos = src.tell();
    chain.main = parse_directory_block(src.read(kDirectoryBlockBytes, "walker: main directory"),
                                       main_pos);
    log_info("container '" + chain.header.magic + "' version " +
             std::to_string(chain.header.version) + ", main directory lists " +
             std::to_string(chain.main.num_entries) + " entries");

    std::unordered_set<uint32_t> seen;
    uint32_t current = chain.main.current;
    while (current != 0) {
        if (!seen.insert(current).second) {
            throw FormatError("walker: directory chain revisits offset " + std::to_string(current));
        }
        if (chain.offsets.size() >= max_blocks) {
            throw FormatError("walker: directory chain longer than " + std::to_string(max_blocks) +
                              " blocks");
        }
        chain.offsets.push_back(current);
        const auto raw = src.read_at(current, kDirectoryBlockBytes, "walker: directory block");
        current = parse_directory_block(raw, chain.offsets.back()).prev;
    }
    log_info("directory chain: " + std::to_string(chain.offsets.size()) + " blocks");
    return chain;
}

} // namespace e2e
