#include "container/decode_result.hpp"

#include "util/log.hpp"

namespace e2e {

const char* issue_kind_name(IssueKind kind) {
    switch (kind) {
    case IssueKind::TruncatedRead: return "truncated read";
    case IssueKind::MalformedLaterality: return "malformed laterality";
    case IssueKind::MalformedRecord: return "malformed record";
    case IssueKind::UnknownVolumeKey: return "unknown volume";
    case IssueKind::UnrecognisedChunkSubtype: return "unrecognised chunk";
    case IssueKind::MalformedSliceId: return "malformed slice id";
    case IssueKind::NonIterableVolume: return "empty volume";
    }
    return "unknown";
}

void record_issue(std::vector<DecodeIssue>& issues, IssueKind kind,
                  const std::string& message, uint64_t offset) {
    log_warn(std::string(issue_kind_name(kind)) + ": " + message);
    issues.push_back(DecodeIssue{kind, message, offset});
}

} // namespace e2e
