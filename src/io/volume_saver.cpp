#include "io/volume_saver.hpp"

#include <dcmtk/config/osconfig.h>   // MUST be first with DCMTK on some platforms
#include <dcmtk/dcmdata/dctk.h>
#include <dcmtk/dcmdata/dcdeftag.h>
#include <dcmtk/dcmdata/dcuid.h>

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace e2e {

namespace {

static std::runtime_error dcmtk_error(const std::string& where, const OFCondition& cond) {
    return std::runtime_error(where + ": " + cond.text());
}

static void put(DcmDataset* ds, const DcmTagKey& tag, const std::string& v) {
    OFCondition st = ds->putAndInsertString(tag, v.c_str());
    if (st.bad()) throw dcmtk_error("putAndInsertString " + std::string(DcmTag(tag).getTagName()), st);
}

static void put(DcmDataset* ds, const DcmTagKey& tag, Uint16 v) {
    OFCondition st = ds->putAndInsertUint16(tag, v);
    if (st.bad()) throw dcmtk_error("putAndInsertUint16 " + std::string(DcmTag(tag).getTagName()), st);
}

// Writes one 8-bit MONOCHROME2 secondary capture with the given frames.
static void write_sc_gray8(const std::string& path, const std::vector<Image>& frames,
                           const std::string& patient_id, const std::optional<Laterality>& laterality,
                           const std::string& description) {
    if (frames.empty()) throw std::runtime_error("save_dicom: no frames for " + path);
    const int w = frames.front().width;
    const int h = frames.front().height;
    if (w <= 0 || h <= 0 || w > 65535 || h > 65535) {
        throw std::runtime_error("save_dicom: frame size not representable: " + path);
    }
    for (const auto& f : frames) {
        if (f.width != w || f.height != h) {
            throw std::runtime_error("save_dicom: frames differ in size: " + path);
        }
    }

    DcmFileFormat ff;
    DcmDataset* ds = ff.getDataset();

    char study_uid[100] = {0}, series_uid[100] = {0}, inst_uid[100] = {0};
    dcmGenerateUniqueIdentifier(study_uid, SITE_STUDY_UID_ROOT);
    dcmGenerateUniqueIdentifier(series_uid, SITE_SERIES_UID_ROOT);
    dcmGenerateUniqueIdentifier(inst_uid, SITE_INSTANCE_UID_ROOT);

    put(ds, DCM_SOPClassUID, UID_SecondaryCaptureImageStorage);
    put(ds, DCM_SOPInstanceUID, inst_uid);
    put(ds, DCM_StudyInstanceUID, study_uid);
    put(ds, DCM_SeriesInstanceUID, series_uid);
    put(ds, DCM_Modality, "OT");
    put(ds, DCM_PatientID, patient_id);
    put(ds, DCM_SeriesDescription, description);
    if (laterality) put(ds, DCM_Laterality, std::string(1, laterality_code(*laterality)));

    put(ds, DCM_Rows, static_cast<Uint16>(h));
    put(ds, DCM_Columns, static_cast<Uint16>(w));
    put(ds, DCM_NumberOfFrames, std::to_string(frames.size()));
    put(ds, DCM_PhotometricInterpretation, "MONOCHROME2");
    put(ds, DCM_SamplesPerPixel, static_cast<Uint16>(1));
    put(ds, DCM_BitsAllocated, static_cast<Uint16>(8));
    put(ds, DCM_BitsStored, static_cast<Uint16>(8));
    put(ds, DCM_HighBit, static_cast<Uint16>(7));
    put(ds, DCM_PixelRepresentation, static_cast<Uint16>(0));

    const size_t frame_bytes = static_cast<size_t>(w) * h;
    std::vector<Uint8> buf;
    buf.reserve(frame_bytes * frames.size());
    for (const auto& f : frames) {
        for (int32_t v : f.pixels) buf.push_back(static_cast<Uint8>(std::clamp(v, 0, 255)));
    }
    OFCondition st = ds->putAndInsertUint8Array(DCM_PixelData, buf.data(), static_cast<unsigned long>(buf.size()));
    if (st.bad()) throw dcmtk_error("PixelData", st);

    st = ff.saveFile(path.c_str(), EXS_LittleEndianExplicit);
    if (st.bad()) throw dcmtk_error("saveFile failed (" + path + ")", st);
}

} // namespace

void save_pgm(const std::string& path, const Image& im) {
    if (im.width <= 0 || im.height <= 0) throw std::runtime_error("Invalid image size");
    if (im.pixels.size() != static_cast<size_t>(im.width) * im.height) {
        throw std::runtime_error("pixel buffer size mismatch");
    }

    std::ofstream ofs(path, std::ios::binary);
    if (!ofs.good()) throw std::runtime_error("Cannot write file: " + path);

    ofs << "P5\n" << im.width << " " << im.height << "\n255\n";
    for (int32_t v : im.pixels) {
        ofs.put(static_cast<char>(static_cast<uint8_t>(std::clamp(v, 0, 255))));
    }
    if (!ofs.good()) throw std::runtime_error("Write failed: " + path);
}

Image to_image(const Raster8& raster) {
    Image im;
    im.width = raster.cols;
    im.height = raster.rows;
    im.pixels.assign(raster.data.begin(), raster.data.end());
    return im;
}

Image to_image(const RasterF& raster) {
    Image im;
    im.width = raster.cols;
    im.height = raster.rows;
    im.pixels.resize(raster.data.size());
    for (size_t i = 0; i < raster.data.size(); ++i) {
        const float v = raster.data[i];
        // NaN maps to 0
        im.pixels[i] = (v > 0.0f) ? static_cast<int32_t>(std::lround(std::min(v, 255.0f))) : 0;
    }
    return im;
}

Image to_image(const Slice& slice) {
    if (const auto* p = std::get_if<PlanarSlice>(&slice)) return to_image(p->raster);
    if (const auto* v = std::get_if<VolumetricSlice>(&slice)) return to_image(v->raster);
    throw std::runtime_error("to_image: empty slice");
}

std::string output_stem(const VolumeKey& key, const std::optional<Laterality>& laterality) {
    std::string s = key.str();
    if (laterality) {
        s += '_';
        s += laterality_code(*laterality);
    }
    return s;
}

std::string volume_stem(const Volume& volume, size_t n) {
    return output_stem(volume.key, volume.laterality) + "_" + std::to_string(n);
}

std::vector<std::string> save_volume_pgm(const std::string& dir, const Volume& volume, size_t n) {
    namespace fs = std::filesystem;
    std::vector<std::string> written;
    const std::string stem = volume_stem(volume, n);
    for (size_t i = 0; i < volume.slices.size(); ++i) {
        if (is_empty(volume.slices[i])) continue;
        const std::string path = (fs::path(dir) / (stem + "_" + std::to_string(i) + ".pgm")).string();
        save_pgm(path, to_image(volume.slices[i]));
        written.push_back(path);
    }
    return written;
}

void save_volume_dicom(const std::string& path, const Volume& volume) {
    std::vector<Image> frames;
    for (const auto& s : volume.slices) {
        if (!is_empty(s)) frames.push_back(to_image(s));
    }
    write_sc_gray8(path, frames, volume.patient_key(), volume.laterality, "volume " + volume.key.str());
}

void save_reference_dicom(const std::string& path, const ReferenceImage& image) {
    write_sc_gray8(path, {to_image(image.raster)}, image.key.str(), image.laterality,
                   "reference " + image.key.str());
}

} // namespace e2e
