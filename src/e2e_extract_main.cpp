#include "cli/cli_parser.hpp"
#include "codec/e2e_reader.hpp"
#include "io/volume_saver.hpp"
#include "util/log.hpp"

#include <filesystem>
#include <iostream>

namespace {

const char* kUsage =
    "Usage: e2e_extract [--in] <file.e2e> --out <dir> [--mode oct|faf] [--format pgm|dicom] "
    "[--quiet] [--verbose]\n";

void write_volume(const std::string& dir, const std::string& format, const e2e::Volume& v, size_t n) {
    namespace fs = std::filesystem;
    if (format == "dicom") {
        e2e::save_volume_dicom((fs::path(dir) / (e2e::volume_stem(v, n) + ".dcm")).string(), v);
    } else {
        e2e::save_volume_pgm(dir, v, n);
    }
}

void write_reference(const std::string& dir, const std::string& format, const e2e::ReferenceImage& r,
                     size_t n) {
    namespace fs = std::filesystem;
    const std::string stem = "ref_" + e2e::output_stem(r.key, r.laterality) + "_" + std::to_string(n);
    if (format == "dicom") {
        e2e::save_reference_dicom((fs::path(dir) / (stem + ".dcm")).string(), r);
    } else {
        e2e::save_pgm((fs::path(dir) / (stem + ".pgm")).string(), e2e::to_image(r.raster));
    }
}

} // namespace

int main(int argc, char** argv) {
    try {
        e2e::CliParser cli;
        cli.parse(argc, argv);
        // input may also be given as the first positional argument
        const std::string in = cli.get("in", cli.positional().empty() ? "" : cli.positional().front());
        const std::string out = cli.get("out");
        const std::string format = cli.get("format", "pgm");
        if (in.empty() || out.empty() || (format != "pgm" && format != "dicom")) {
            std::cerr << kUsage;
            return 1;
        }
        if (cli.has("quiet")) e2e::set_log_level(e2e::LogLevel::Quiet);
        if (cli.has("verbose")) e2e::set_log_level(e2e::LogLevel::Info);

        e2e::ReadOptions opt;
        try {
            opt = e2e::ReadOptions::for_mode(e2e::parse_read_mode(cli.get("mode", "oct")));
        } catch (const std::runtime_error& e) {
            std::cerr << e.what() << "\n" << kUsage;
            return 1;
        }

        const e2e::DecodeResult result = e2e::read_e2e(in, opt);

        std::filesystem::create_directories(out);
        size_t n = 0;
        for (const auto& v : result.volumes) write_volume(out, format, v, n++);
        n = 0;
        for (const auto& r : result.reference_images) write_reference(out, format, r, n++);
        for (const auto& kv : result.reference_by_volume) write_reference(out, format, kv.second, n++);
        for (const auto& kv : result.patients) {
            e2e::log_info("patient " + std::to_string(kv.first) + ": " + kv.second.surname + ", " +
                          kv.second.name);
        }

        std::cout << "Wrote: " << out << " (" << result.volumes.size() << " volumes, "
                  << result.reference_images.size() + result.reference_by_volume.size()
                  << " reference images)\n";
        if (!result.complete) {
            e2e::log_warn("partial decode: " + std::to_string(result.chunks_skipped()) + " of " +
                          std::to_string(result.chunks_total) + " chunks not processed");
            return 3;
        }
        return 0;
    } catch (const std::exception& e) {
        e2e::log_error(e.what());
        return 2;
    }
}
