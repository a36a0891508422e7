#include "codec/e2e_reader.hpp"

#include "container/chunk_dispatcher.hpp"
#include "container/chunk_index.hpp"
#include "container/directory_walker.hpp"
#include "container/volume_assembler.hpp"
#include "io/byte_source.hpp"
#include "util/log.hpp"

#include <fstream>
#include <stdexcept>
#include <utility>

namespace e2e {

DecodeResult read_e2e(std::istream& is, const ReadOptions& opt) {
    ByteSource src(is);

    // Header and directory stages: any failure here is fatal.
    const DirectoryChain chain = walk_directory_chain(src, opt.max_directory_chain);
    ChunkIndex index = build_chunk_index(src, chain.offsets, opt);
    VolumeTable volumes = materialize_volumes(index, opt);

    DecodeResult result;
    result.issues = std::move(index.issues);
    dispatch_chunks(src, std::move(index.chunks), opt, volumes, result);
    result.volumes = assemble_volumes(std::move(volumes), opt, result.issues);

    log_info("decoded " + std::to_string(result.volumes.size()) + " volumes, " +
             std::to_string(result.reference_images.size() + result.reference_by_volume.size()) +
             " reference images, " + std::to_string(result.issues.size()) + " issues");
    return result;
}

DecodeResult read_e2e(const std::string& path, const ReadOptions& opt) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs.good()) throw std::runtime_error("Cannot open file: " + path);
    return read_e2e(ifs, opt);
}

} // namespace e2e
