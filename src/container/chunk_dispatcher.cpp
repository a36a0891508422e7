#include "container/chunk_dispatcher.hpp"

#include "codec/pixel_decoders.hpp"
#include "format/errors.hpp"
#include "format/records.hpp"
#include "util/log.hpp"

#include <string>
#include <utility>

namespace e2e {

namespace {

static std::string chunk_desc(const ChunkHeader& c) {
    return "volume " + VolumeKey{c.patient_id, c.study_id, c.series_id}.str() + " slice " +
           std::to_string(c.slice_id);
}

} // namespace

std::optional<Laterality> laterality_from_code(uint8_t code) {
    if (code == kLateralityRight) return Laterality::Right;
    if (code == kLateralityLeft) return Laterality::Left;
    return std::nullopt;
}

std::optional<Laterality> next_planar_laterality(DispatchState& state, const ReadOptions& opt) {
    const size_t n = state.planar_seen++;
    if (opt.planar_laterality == PlanarLateralityPolicy::FirstPlanarImagesRight) {
        return n < opt.right_eye_planar_count ? Laterality::Right : Laterality::Left;
    }
    return state.laterality;
}

void ChunkDispatcher::dispatch(const ChunkLocation& loc, DispatchState& state) {
    const ChunkHeader chunk =
        parse_chunk_header(src_.read_at(loc.start, kChunkHeaderBytes, "dispatch: chunk header"), loc.start);

    if (chunk.type == kChunkTypeLaterality && opt_.read_laterality_records) {
        on_laterality(loc, state);
    } else if (chunk.type == kChunkTypePatientInfo && opt_.read_patient_records) {
        on_patient_info(loc, chunk);
    } else if (chunk.type == kChunkTypeImage) {
        on_image(loc, chunk, state);
    }
    // anything else carries nothing we decode
}

void ChunkDispatcher::on_laterality(const ChunkLocation& loc, DispatchState& state) {
    const uint64_t at = src_.tell();
    const auto raw = src_.read(kLateralityBytes, "dispatch: laterality");
    LateralityBlock block;
    try {
        block = parse_laterality_block(raw, at);
    } catch (const FormatError& e) {
        record_issue(out_.issues, IssueKind::MalformedLaterality, e.what(), loc.start);
        return;
    }
    state.laterality = laterality_from_code(block.laterality);
    if (state.laterality) {
        log_info(std::string("laterality record: ") + laterality_code(*state.laterality));
    }
}

void ChunkDispatcher::on_patient_info(const ChunkLocation& loc, const ChunkHeader& chunk) {
    const uint64_t at = src_.tell();
    const auto raw = src_.read(kPatientInfoBytes, "dispatch: patient info");
    try {
        out_.patients[chunk.patient_id] = parse_patient_info(raw, at);
    } catch (const FormatError& e) {
        record_issue(out_.issues, IssueKind::MalformedRecord, e.what(), loc.start);
    }
}

void ChunkDispatcher::on_image(const ChunkLocation& loc, const ChunkHeader& chunk, DispatchState& state) {
    const uint64_t at = src_.tell();
    const ImageHeader img = parse_image_header(src_.read(kImageHeaderBytes, "dispatch: image header"), at);

    if (chunk.ind == kImagePlanar) {
        on_planar(loc, chunk, img, state);
    } else if (chunk.ind == kImageVolumetric) {
        on_volumetric(loc, chunk, img, state);
    } else {
        record_issue(out_.issues, IssueKind::UnrecognisedChunkSubtype,
                     "image chunk with ind " + std::to_string(chunk.ind) + " (" + chunk_desc(chunk) + ")",
                     loc.start);
    }
}

void ChunkDispatcher::on_planar(const ChunkLocation& loc, const ChunkHeader& chunk, const ImageHeader& img,
                                DispatchState& state) {
    const size_t n = static_cast<size_t>(img.width) * img.height;
    Raster8 raster = decode_planar(src_.read(n, "dispatch: planar pixels"), img.width, img.height);
    const std::optional<Laterality> lat = next_planar_laterality(state, opt_);
    const VolumeKey key{chunk.patient_id, chunk.study_id, chunk.series_id};

    if (opt_.reference_layout == ReferenceLayout::List) {
        out_.reference_images.push_back(ReferenceImage{key, lat, std::move(raster)});
        return;
    }

    out_.reference_by_volume[key.str()] = ReferenceImage{key, lat, raster};
    Volume* volume = find_volume(loc, chunk);
    if (!volume) return;
    Slice* slot = find_slot(loc, chunk, *volume);
    if (!slot) return;
    *slot = PlanarSlice{lat, std::move(raster)};
}

void ChunkDispatcher::on_volumetric(const ChunkLocation& loc, const ChunkHeader& chunk, const ImageHeader& img,
                                    const DispatchState& state) {
    const size_t n = static_cast<size_t>(img.width) * img.height;
    RasterF raster = decode_custom_float_raster(src_.read(n * 2, "dispatch: volumetric pixels"),
                                                img.width, img.height);
    apply_gamma(raster);

    Volume* volume = find_volume(loc, chunk);
    if (!volume) return;
    Slice* slot = find_slot(loc, chunk, *volume);
    if (!slot) return;
    *slot = VolumetricSlice{std::move(raster)};
    if (state.laterality && !volume->laterality) volume->laterality = state.laterality;
}

Volume* ChunkDispatcher::find_volume(const ChunkLocation& loc, const ChunkHeader& chunk) {
    const VolumeKey key{chunk.patient_id, chunk.study_id, chunk.series_id};
    auto it = volumes_.find(key);
    if (it == volumes_.end()) {
        record_issue(out_.issues, IssueKind::UnknownVolumeKey,
                     "failed to save image data for volume " + key.str(), loc.start);
        return nullptr;
    }
    return &it->second;
}

Slice* ChunkDispatcher::find_slot(const ChunkLocation& loc, const ChunkHeader& chunk, Volume& volume) {
    if (chunk.slice_id % 2 != 0) {
        record_issue(out_.issues, IssueKind::MalformedSliceId, "odd slice id (" + chunk_desc(chunk) + ")",
                     loc.start);
        return nullptr;
    }
    const int64_t idx = static_cast<int64_t>(chunk.slice_id / 2) - 1;
    if (idx < 0 || idx >= static_cast<int64_t>(volume.slices.size())) {
        record_issue(out_.issues, IssueKind::MalformedSliceId,
                     "slice index " + std::to_string(idx) + " outside [0, " +
                         std::to_string(volume.slices.size()) + ") (" + chunk_desc(chunk) + ")",
                     loc.start);
        return nullptr;
    }
    return &volume.slices[static_cast<size_t>(idx)];
}

void dispatch_chunks(ByteSource& src, std::vector<ChunkLocation> chunks, const ReadOptions& opt,
                     VolumeTable& volumes, DecodeResult& out) {
    ChunkDispatcher dispatcher(src, opt, volumes, out);
    DispatchState state;
    out.chunks_total = chunks.size();
    for (const auto& loc : chunks) {
        try {
            dispatcher.dispatch(loc, state);
        } catch (const TruncatedRead& e) {
            record_issue(out.issues, IssueKind::TruncatedRead, e.what(), loc.start);
            out.complete = false;
            break;
        } catch (const FormatError& e) {
            // bad record inside this chunk only; the rest of the stream is still aligned
            record_issue(out.issues, IssueKind::MalformedRecord, e.what(), loc.start);
        }
        ++out.chunks_processed;
    }
    log_info("dispatched " + std::to_string(out.chunks_processed) + "/" + std::to_string(out.chunks_total) +
             " chunks");
}

} // namespace e2e
