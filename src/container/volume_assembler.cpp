#include "container/volume_assembler.hpp"

#include <string>
#include <utility>

namespace e2e {

namespace {

static std::optional<Laterality> slot_laterality(const Slice& s, const Volume& owner) {
    if (const auto* p = std::get_if<PlanarSlice>(&s)) return p->laterality;
    return owner.laterality;
}

static void split_volume(Volume& v, std::vector<Volume>& out, std::vector<DecodeIssue>& issues) {
    for (size_t i = 0; i < v.slices.size(); ++i) {
        Slice& s = v.slices[i];
        if (is_empty(s)) {
            record_issue(issues, IssueKind::NonIterableVolume,
                         "volume " + v.key.str() + " slot " + std::to_string(i) + " holds no image");
            continue;
        }
        Volume single;
        single.key = v.key;
        single.laterality = slot_laterality(s, v);
        single.slices.push_back(std::move(s));
        out.push_back(std::move(single));
    }
}

} // namespace

std::vector<Volume> assemble_volumes(VolumeTable&& volumes, const ReadOptions& opt,
                                     std::vector<DecodeIssue>& issues) {
    std::vector<Volume> out;
    out.reserve(volumes.size());
    for (auto& kv : volumes) {
        Volume& v = kv.second;
        if (v.populated() == 0) {
            record_issue(issues, IssueKind::NonIterableVolume,
                         "volume " + v.key.str() + " received no image data");
            continue;
        }
        if (opt.split_by_laterality) {
            split_volume(v, out, issues);
        } else {
            out.push_back(std::move(v));
        }
    }
    volumes.clear();
    return out;
}

} // namespace e2e
