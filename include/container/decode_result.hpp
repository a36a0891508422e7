#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "format/e2e_format.hpp"
#include "io/image_types.hpp"

namespace e2e {

enum class IssueKind {
    TruncatedRead,
    MalformedLaterality,
    MalformedRecord,
    UnknownVolumeKey,
    UnrecognisedChunkSubtype,
    MalformedSliceId,
    NonIterableVolume,
};

const char* issue_kind_name(IssueKind kind);

// A recovered problem. `offset` is the chunk (or record) position, 0 when
// not tied to one.
struct DecodeIssue {
    IssueKind kind;
    std::string message;
    uint64_t offset = 0;
};

struct DecodeResult {
    std::vector<Volume> volumes;
    // ReferenceLayout::List
    std::vector<ReferenceImage> reference_images;
    // ReferenceLayout::PerVolume, keyed by VolumeKey::str()
    std::map<std::string, ReferenceImage> reference_by_volume;
    std::map<uint32_t, PatientInfo> patients;

    std::vector<DecodeIssue> issues;
    // false when chunk processing stopped early on a truncated read
    bool complete = true;
    size_t chunks_total = 0;
    size_t chunks_processed = 0;

    size_t chunks_skipped() const { return chunks_total - chunks_processed; }
    size_t count(IssueKind kind) const {
        size_t n = 0;
        for (const auto& i : issues) n += (i.kind == kind) ? 1 : 0;
        return n;
    }
};

// Appends to `issues` and logs at warn level.
void record_issue(std::vector<DecodeIssue>& issues, IssueKind kind,
                  const std::string& message, uint64_t offset = 0);

} // namespace e2e
