#include "openmotion/blackvue.h"
#include "openmotion/build_info.h"
#include "openmotion/camm_builder.h"
#include "openmotion/file_source.h"
#include "openmotion/gpmf.h"
#include "openmotion/gps_filter.h"
#include "openmotion/mp4_builder.h"
#include "openmotion/resource_policy.h"

#include <cinttypes>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>
#include <vector>

namespace openmotion {
namespace {

    enum class InputKind : uint8_t {
        Auto,
        Gpmf,
        BlackVue,
        Csv,
    };


    static void usage(const char* argv0)
    {
        std::printf(
            "Usage: %s [options] <video> <output>\n"
            "\n"
            "Rewrites a video keeping its video tracks and adding a CAMM\n"
            "metadata track built from the GPS data found in the video\n"
            "(GoPro GPMF or BlackVue NMEA) or from a CSV file.\n"
            "\n"
            "Options:\n"
            "  --help                 Show this help\n"
            "  --version              Print OpenMotion build info\n"
            "  --no-build-info        Hide build info header\n"
            "  --from KIND            auto|gpmf|blackvue (default: auto)\n"
            "  --csv <path>           Read time,lat,lon[,alt] rows instead\n"
            "  --make <text>          Camera make stored in udta\n"
            "  --model <text>         Camera model stored in udta\n"
            "  --gopro-gps            Write GoPro points with fix and precision\n"
            "                         (type 1030) instead of MIN_GPS\n"
            "  --imu                  Also write GPMF ACCL/GYRO/MAGN samples\n"
            "  --no-filter            Keep noisy GoPro GPS points\n"
            "  --max-file-bytes N     Refuse larger inputs (default: 0=unlimited)\n"
            "  --max-samples N        Sample table limit per track\n"
            "                         (default: 16777216)\n",
            argv0 ? argv0 : "cammwrite");
    }


    static bool parse_u64_arg(const char* s, uint64_t* out)
    {
        if (!s || !*s || !out) {
            return false;
        }
        char* end            = nullptr;
        unsigned long long v = std::strtoull(s, &end, 10);
        if (!end || *end != '\0') {
            return false;
        }
        *out = static_cast<uint64_t>(v);
        return true;
    }


    static bool parse_u32_arg(const char* s, uint32_t* out)
    {
        if (!s || !*s || !out) {
            return false;
        }
        char* end       = nullptr;
        unsigned long v = std::strtoul(s, &end, 10);
        if (!end || *end != '\0') {
            return false;
        }
        *out = static_cast<uint32_t>(v);
        return true;
    }


    static void print_build_info_header()
    {
        std::string line1;
        std::string line2;
        format_build_info_lines(&line1, &line2);
        std::printf("%s\n%s\n", line1.c_str(), line2.c_str());
    }


    static const char* file_status_name(FileStatus status) noexcept
    {
        switch (status) {
        case FileStatus::Ok: return "ok";
        case FileStatus::OpenFailed: return "open_failed";
        case FileStatus::StatFailed: return "stat_failed";
        case FileStatus::ReadFailed: return "read_failed";
        case FileStatus::WriteFailed: return "write_failed";
        case FileStatus::RenameFailed: return "rename_failed";
        }
        return "unknown";
    }


    static const char* io_status_name(IoStatus status) noexcept
    {
        switch (status) {
        case IoStatus::Ok: return "ok";
        case IoStatus::IoError: return "io_error";
        case IoStatus::InvalidArgument: return "invalid_argument";
        case IoStatus::Unsupported: return "unsupported";
        }
        return "unknown";
    }


    static bool parse_input_kind(const char* s, InputKind* out) noexcept
    {
        if (std::strcmp(s, "auto") == 0) {
            *out = InputKind::Auto;
        } else if (std::strcmp(s, "gpmf") == 0) {
            *out = InputKind::Gpmf;
        } else if (std::strcmp(s, "blackvue") == 0) {
            *out = InputKind::BlackVue;
        } else {
            return false;
        }
        return true;
    }


    static bool parse_double_field(const char* begin, const char* end,
                                   double* out)
    {
        std::string field(begin, end);
        char* stop = nullptr;
        *out       = std::strtod(field.c_str(), &stop);
        if (!stop || stop == field.c_str()) {
            return false;
        }
        while (*stop == ' ' || *stop == '\t' || *stop == '\r'
               || *stop == '\n') {
            ++stop;
        }
        return *stop == '\0';
    }


    // Rows are `time,lat,lon[,alt]`; a header row and blank lines are
    // skipped, any other unparsable row fails the whole file.
    static bool read_csv_points(const char* path, std::vector<Point>* out,
                                uint32_t* bad_line)
    {
        std::FILE* f = std::fopen(path, "rb");
        if (!f) {
            *bad_line = 0;
            return false;
        }
        char buf[1024];
        uint32_t line_no = 0;
        bool ok          = true;
        while (std::fgets(buf, sizeof(buf), f)) {
            line_no += 1;
            const char* p   = buf;
            const char* eol = buf + std::strlen(buf);
            while (p < eol && (*p == ' ' || *p == '\t')) {
                ++p;
            }
            if (p == eol || *p == '\n' || *p == '\r' || *p == '#') {
                continue;
            }

            std::vector<double> values;
            bool row_ok = true;
            while (p < eol) {
                const char* comma = static_cast<const char*>(
                    std::memchr(p, ',', static_cast<size_t>(eol - p)));
                const char* field_end = comma ? comma : eol;
                double v              = 0.0;
                if (!parse_double_field(p, field_end, &v)) {
                    row_ok = false;
                    break;
                }
                values.push_back(v);
                if (!comma) {
                    break;
                }
                p = comma + 1;
            }
            if (!row_ok || values.size() < 3U || values.size() > 4U) {
                if (line_no == 1U) {
                    continue;
                }
                *bad_line = line_no;
                ok        = false;
                break;
            }
            Point point;
            point.time = values[0];
            point.lat  = values[1];
            point.lon  = values[2];
            if (values.size() == 4U) {
                point.alt = values[3];
            }
            out->push_back(point);
        }
        std::fclose(f);
        return ok;
    }


    static Point point_from_gps(const GpsPoint& g)
    {
        Point p;
        p.time  = g.time;
        p.lat   = g.lat;
        p.lon   = g.lon;
        p.alt   = g.alt;
        p.angle = g.angle;
        return p;
    }


    struct CollectOptions final {
        InputKind kind       = InputKind::Auto;
        bool gopro_gps       = false;
        bool imu             = false;
        bool filter          = true;
        Mp4ReadOptions read;
        GpsFilterOptions gps_filter;
    };


    static TelemetryStatus collect_gpmf(FileSource& file,
                                        const CollectOptions& options,
                                        CammInfo* info)
    {
        VideoTelemetry telemetry;
        const TelemetryStatus st = extract_gpmf_telemetry(file, &telemetry,
                                                          options.read);
        if (st != TelemetryStatus::Ok) {
            return st;
        }
        std::vector<GpsPoint> gps = std::move(telemetry.gps);
        if (options.filter) {
            GpsFilterStats stats;
            gps = remove_noisy_points(gps, options.gps_filter, &stats);
            std::printf("  gps_filter fix=%zu dop=%zu outliers=%zu"
                        " sequences=%zu groups=%zu\n",
                        stats.removed_by_fix, stats.removed_by_dop,
                        stats.removed_outliers, stats.sequences_after_split,
                        stats.groups_after_merge);
        }
        if (options.gopro_gps) {
            info->gopro_gps = std::move(gps);
        } else {
            info->mini_gps.reserve(gps.size());
            for (const GpsPoint& g : gps) {
                info->mini_gps.push_back(point_from_gps(g));
            }
        }
        if (options.imu) {
            info->accl = std::move(telemetry.accl);
            info->gyro = std::move(telemetry.gyro);
            info->magn = std::move(telemetry.magn);
        }

        std::string model;
        const TelemetryStatus mst = extract_gpmf_camera_model(file, &model,
                                                              options.read);
        if (mst == TelemetryStatus::Ok && info->model.empty()) {
            info->model = model;
        }
        if (info->make.empty()) {
            info->make = "GoPro";
        }
        return TelemetryStatus::Ok;
    }


    static TelemetryStatus collect_blackvue(FileSource& file,
                                            const CollectOptions& options,
                                            CammInfo* info)
    {
        BlackVueInfo blackvue;
        NmeaParseStats stats;
        const TelemetryStatus st = extract_blackvue_info(
            file, &blackvue, options.read.box_limits, &stats);
        if (st != TelemetryStatus::Ok) {
            return st;
        }
        std::printf("  nmea lines=%u sentences=%u bad_checksum=%u skipped=%u"
                    " points=%u\n",
                    stats.lines, stats.sentences, stats.bad_checksum,
                    stats.skipped, stats.points);
        info->mini_gps.reserve(blackvue.gps.size());
        for (const GpsPoint& g : blackvue.gps) {
            info->mini_gps.push_back(point_from_gps(g));
        }
        if (info->make.empty()) {
            info->make = blackvue.make;
        }
        if (info->model.empty()) {
            info->model = blackvue.model;
        }
        return TelemetryStatus::Ok;
    }


    static TelemetryStatus collect_from_video(FileSource& file,
                                              const CollectOptions& options,
                                              CammInfo* info)
    {
        switch (options.kind) {
        case InputKind::Gpmf: return collect_gpmf(file, options, info);
        case InputKind::BlackVue: return collect_blackvue(file, options, info);
        case InputKind::Csv: return TelemetryStatus::NotFound;
        case InputKind::Auto: break;
        }
        const TelemetryStatus st = collect_gpmf(file, options, info);
        if (st != TelemetryStatus::NotFound) {
            return st;
        }
        return collect_blackvue(file, options, info);
    }

}  // namespace
}  // namespace openmotion


int
main(int argc, char** argv)
{
    using namespace openmotion;

    bool show_build_info = true;
    std::string csv_path;
    std::string make;
    std::string model;
    CollectOptions collect;
    OpenMotionResourcePolicy policy = recommended_resource_policy();
    uint64_t max_file_bytes         = policy.max_file_bytes;

    int first_path = 1;
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (!arg) {
            continue;
        }
        if (std::strcmp(arg, "--help") == 0) {
            usage(argv[0]);
            return 0;
        }
        if (std::strcmp(arg, "--version") == 0) {
            print_build_info_header();
            return 0;
        }
        if (std::strcmp(arg, "--no-build-info") == 0) {
            show_build_info = false;
            first_path += 1;
            continue;
        }
        if (std::strcmp(arg, "--from") == 0 && i + 1 < argc) {
            if (!parse_input_kind(argv[i + 1], &collect.kind)) {
                std::fprintf(stderr, "invalid --from value\n");
                return 2;
            }
            i += 1;
            first_path += 2;
            continue;
        }
        if (std::strcmp(arg, "--csv") == 0 && i + 1 < argc) {
            csv_path     = argv[i + 1];
            collect.kind = InputKind::Csv;
            i += 1;
            first_path += 2;
            continue;
        }
        if (std::strcmp(arg, "--make") == 0 && i + 1 < argc) {
            make = argv[i + 1];
            i += 1;
            first_path += 2;
            continue;
        }
        if (std::strcmp(arg, "--model") == 0 && i + 1 < argc) {
            model = argv[i + 1];
            i += 1;
            first_path += 2;
            continue;
        }
        if (std::strcmp(arg, "--gopro-gps") == 0) {
            collect.gopro_gps = true;
            first_path += 1;
            continue;
        }
        if (std::strcmp(arg, "--imu") == 0) {
            collect.imu = true;
            first_path += 1;
            continue;
        }
        if (std::strcmp(arg, "--no-filter") == 0) {
            collect.filter = false;
            first_path += 1;
            continue;
        }
        if (std::strcmp(arg, "--max-file-bytes") == 0 && i + 1 < argc) {
            if (!parse_u64_arg(argv[i + 1], &max_file_bytes)) {
                std::fprintf(stderr, "invalid --max-file-bytes value\n");
                return 2;
            }
            i += 1;
            first_path += 2;
            continue;
        }
        if (std::strcmp(arg, "--max-samples") == 0 && i + 1 < argc) {
            if (!parse_u32_arg(argv[i + 1],
                               &policy.sample_limits.max_samples)
                || policy.sample_limits.max_samples == 0U) {
                std::fprintf(stderr, "invalid --max-samples value\n");
                return 2;
            }
            i += 1;
            first_path += 2;
            continue;
        }
        break;
    }
    policy.max_file_bytes = max_file_bytes;

    if (argc - first_path != 2) {
        usage(argv[0]);
        return 2;
    }
    const char* input_path  = argv[first_path];
    const char* output_path = argv[first_path + 1];
    if (std::strcmp(input_path, output_path) == 0) {
        std::fprintf(stderr, "cammwrite: output must differ from input\n");
        return 2;
    }

    if (show_build_info) {
        print_build_info_header();
    }

    Mp4TransformOptions transform_options;
    CammBuildOptions camm_options;
    apply_resource_policy(policy, &collect.read, &transform_options);
    apply_resource_policy(policy, &camm_options, &collect.gps_filter);

    FileSource file;
    const FileStatus fst = file.open(input_path);
    if (fst != FileStatus::Ok) {
        std::fprintf(stderr, "cammwrite: %s: %s\n", input_path,
                     file_status_name(fst));
        return 1;
    }
    if (policy.max_file_bytes != 0U && file.size() > policy.max_file_bytes) {
        std::fprintf(stderr, "cammwrite: %s: too_large\n", input_path);
        return 1;
    }

    std::printf("== %s\n", input_path);

    CammInfo info;
    info.make  = make;
    info.model = model;
    if (collect.kind == InputKind::Csv) {
        uint32_t bad_line = 0;
        if (!read_csv_points(csv_path.c_str(), &info.mini_gps, &bad_line)) {
            if (bad_line == 0U) {
                std::fprintf(stderr, "cammwrite: %s: open_failed\n",
                             csv_path.c_str());
            } else {
                std::fprintf(stderr, "cammwrite: %s:%u: malformed row\n",
                             csv_path.c_str(), bad_line);
            }
            return 1;
        }
    } else {
        const TelemetryStatus st = collect_from_video(file, collect, &info);
        if (st != TelemetryStatus::Ok) {
            std::fprintf(stderr, "cammwrite: %s: telemetry=%s\n", input_path,
                         telemetry_status_name(st));
            return 1;
        }
    }
    std::printf("  make=\"%s\" model=\"%s\" mini_gps=%zu gopro_gps=%zu"
                " accl=%zu gyro=%zu magn=%zu\n",
                info.make.c_str(), info.model.c_str(), info.mini_gps.size(),
                info.gopro_gps.size(), info.accl.size(), info.gyro.size(),
                info.magn.size());

    if (file.seek(0, SeekWhence::Set, nullptr) != IoStatus::Ok) {
        std::fprintf(stderr, "cammwrite: %s: seek failed\n", input_path);
        return 1;
    }

    std::unique_ptr<SampleGenerator> generator
        = make_camm_sample_generator(std::move(info), camm_options);
    ChainedIO composed;
    const BoxStatus bst = transform_mp4(file, generator.get(), &composed,
                                        transform_options);
    if (bst != BoxStatus::Ok) {
        std::fprintf(stderr, "cammwrite: %s: transform=%s\n", input_path,
                     box_status_name(bst));
        return 1;
    }

    const WriteFileResult written = write_stream_to_file(composed,
                                                         output_path);
    if (written.status != FileStatus::Ok) {
        if (written.status == FileStatus::ReadFailed) {
            std::fprintf(stderr, "cammwrite: %s: %s (%s)\n", output_path,
                         file_status_name(written.status),
                         io_status_name(written.io_status));
        } else {
            std::fprintf(stderr, "cammwrite: %s: %s\n", output_path,
                         file_status_name(written.status));
        }
        return 1;
    }
    std::printf("  wrote %s bytes=%" PRIu64 "\n", output_path,
                written.bytes_written);
    return 0;
}
