#include "openmotion/box_reader.h"
#include "openmotion/build_info.h"
#include "openmotion/file_source.h"
#include "openmotion/movie_box.h"
#include "openmotion/resource_policy.h"

#include <array>
#include <cinttypes>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <span>
#include <string>
#include <vector>

namespace openmotion {
namespace {

    constexpr std::array<uint32_t, 8> kContainerTypes = {
        fourcc('m', 'o', 'o', 'v'), fourcc('t', 'r', 'a', 'k'),
        fourcc('e', 'd', 't', 's'), fourcc('m', 'd', 'i', 'a'),
        fourcc('m', 'i', 'n', 'f'), fourcc('d', 'i', 'n', 'f'),
        fourcc('s', 't', 'b', 'l'), fourcc('u', 'd', 't', 'a'),
    };

    static void usage(const char* argv0)
    {
        std::printf(
            "Usage: %s [options] <file> [file...]\n"
            "\n"
            "Prints the MP4 box tree and a summary of every track.\n"
            "\n"
            "Options:\n"
            "  --help                 Show this help\n"
            "  --version              Print OpenMotion build info\n"
            "  --no-build-info        Hide build info header\n"
            "  --no-tree              Skip the box tree\n"
            "  --samples              List the samples of every track\n"
            "  --max-samples N        Samples listed per track (default: 32,\n"
            "                         0=all)\n"
            "  --max-file-bytes N     Refuse larger inputs (default: 0=unlimited)\n"
            "  --max-depth N          Box nesting limit (default: 32)\n"
            "  --max-boxes N          Box count limit (default: 1048576)\n",
            argv0 ? argv0 : "mp4dump");
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


    class TreePrinter final : public BoxVisitor {
    public:
        bool on_box(const BoxHeader& header, uint32_t depth,
                    ByteSource& stream) noexcept override
        {
            (void)stream;
            std::printf("  %*s%s offset=%" PRIu64 " size=%" PRIu64
                        " header=%u\n",
                        static_cast<int>(depth * 2U), "",
                        fourcc_to_string(header.type).c_str(), header.offset,
                        header.box_size, header.header_size);
            boxes += 1;
            return true;
        }

        uint64_t boxes = 0;
    };


    static void print_track(size_t index, const TrackBox& track,
                            bool list_samples, uint32_t max_listed,
                            const SampleTableLimits& limits)
    {
        const TrackHeader* tkhd      = track.tkhd();
        const MediaHeader* mdhd      = track.mdhd();
        const HandlerReference* hdlr = track.hdlr();

        std::printf("  track[%zu] id=%u handler=%s", index,
                    tkhd ? tkhd->track_id : 0U,
                    hdlr ? fourcc_to_string(hdlr->handler_type).c_str()
                         : "none");
        if (mdhd) {
            const double seconds
                = mdhd->timescale != 0U
                      ? static_cast<double>(mdhd->duration) / mdhd->timescale
                      : 0.0;
            std::printf(" timescale=%u duration=%.3fs", mdhd->timescale,
                        seconds);
        }
        if (tkhd && (tkhd->width != 0U || tkhd->height != 0U)) {
            std::printf(" size=%ux%u", tkhd->width >> 16, tkhd->height >> 16);
        }
        std::printf("\n");

        if (const EditList* elst = track.elst()) {
            for (size_t i = 0; i < elst->entries.size(); ++i) {
                const EditListEntry& e = elst->entries[i];
                std::printf("    edit[%zu] duration=%" PRId64
                            " media_time=%" PRId64 "\n",
                            i, e.segment_duration, e.media_time);
            }
        }

        StblSamples table;
        std::vector<Sample> samples;
        const BoxStatus st = track.samples(&table, &samples, limits);
        if (st != BoxStatus::Ok) {
            std::printf("    samples=%s\n", box_status_name(st));
            return;
        }
        std::printf("    samples=%zu descriptions=%zu", samples.size(),
                    table.descriptions.size());
        if (!table.descriptions.empty()) {
            std::printf(" format=%s",
                        fourcc_to_string(table.descriptions[0].format).c_str());
        }
        std::printf("\n");
        if (!list_samples) {
            return;
        }

        size_t listed = samples.size();
        if (max_listed != 0U && listed > max_listed) {
            listed = max_listed;
        }
        for (size_t i = 0; i < listed; ++i) {
            const Sample& s = samples[i];
            std::printf("    [%zu] offset=%" PRIu64 " size=%u time=%.6f"
                        " delta=%.6f%s\n",
                        i, s.raw.offset, s.raw.size, s.exact_time,
                        s.exact_timedelta, s.raw.is_sync ? " sync" : "");
        }
        if (listed < samples.size()) {
            std::printf("    ... %zu more\n", samples.size() - listed);
        }
    }

}  // namespace
}  // namespace openmotion


int
main(int argc, char** argv)
{
    using namespace openmotion;

    bool show_build_info = true;
    bool show_tree       = true;
    bool list_samples    = false;
    uint32_t max_listed  = 32U;
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
        if (std::strcmp(arg, "--no-tree") == 0) {
            show_tree = false;
            first_path += 1;
            continue;
        }
        if (std::strcmp(arg, "--samples") == 0) {
            list_samples = true;
            first_path += 1;
            continue;
        }
        if (std::strcmp(arg, "--max-samples") == 0 && i + 1 < argc) {
            if (!parse_u32_arg(argv[i + 1], &max_listed)) {
                std::fprintf(stderr, "invalid --max-samples value\n");
                return 2;
            }
            i += 1;
            first_path += 2;
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
        if (std::strcmp(arg, "--max-depth") == 0 && i + 1 < argc) {
            if (!parse_u32_arg(argv[i + 1], &policy.box_limits.max_depth)
                || policy.box_limits.max_depth == 0U) {
                std::fprintf(stderr, "invalid --max-depth value\n");
                return 2;
            }
            i += 1;
            first_path += 2;
            continue;
        }
        if (std::strcmp(arg, "--max-boxes") == 0 && i + 1 < argc) {
            if (!parse_u32_arg(argv[i + 1], &policy.box_limits.max_boxes)
                || policy.box_limits.max_boxes == 0U) {
                std::fprintf(stderr, "invalid --max-boxes value\n");
                return 2;
            }
            i += 1;
            first_path += 2;
            continue;
        }
        break;
    }
    policy.max_file_bytes = max_file_bytes;

    if (first_path >= argc) {
        usage(argv[0]);
        return 2;
    }

    if (show_build_info) {
        print_build_info_header();
    }

    Mp4ReadOptions read_options;
    apply_resource_policy(policy, &read_options, nullptr);

    bool any_failed = false;
    for (int i = first_path; i < argc; ++i) {
        const char* path = argv[i];
        if (!path || !*path) {
            continue;
        }

        FileSource file;
        const FileStatus fst = file.open(path);
        if (fst != FileStatus::Ok) {
            std::fprintf(stderr, "mp4dump: %s: %s\n", path,
                         file_status_name(fst));
            any_failed = true;
            continue;
        }
        if (policy.max_file_bytes != 0U
            && file.size() > policy.max_file_bytes) {
            std::fprintf(stderr, "mp4dump: %s: too_large\n", path);
            any_failed = true;
            continue;
        }

        std::printf("== %s\n", path);
        std::printf("  file_size=%" PRIu64 "\n", file.size());

        if (show_tree) {
            TreePrinter printer;
            const BoxStatus st = parse_boxes_recursive(
                file, kUnboundedSize,
                std::span<const uint32_t>(kContainerTypes.data(),
                                          kContainerTypes.size()),
                printer, read_options.box_limits);
            if (st != BoxStatus::Ok) {
                std::fprintf(stderr, "mp4dump: %s: box_tree=%s\n", path,
                             box_status_name(st));
                any_failed = true;
            }
            std::printf("  boxes=%" PRIu64 "\n", printer.boxes);
            if (file.seek(0, SeekWhence::Set, nullptr) != IoStatus::Ok) {
                std::fprintf(stderr, "mp4dump: %s: seek failed\n", path);
                any_failed = true;
                continue;
            }
        }

        MovieBox movie;
        const BoxStatus mst = movie.parse_stream(file,
                                                 read_options.box_limits);
        if (mst != BoxStatus::Ok) {
            std::fprintf(stderr, "mp4dump: %s: moov=%s\n", path,
                         box_status_name(mst));
            any_failed = true;
            continue;
        }

        if (const MovieHeader* mvhd = movie.mvhd()) {
            const double seconds
                = mvhd->timescale != 0U
                      ? static_cast<double>(mvhd->duration) / mvhd->timescale
                      : 0.0;
            std::printf("  movie timescale=%u duration=%.3fs created=%" PRId64
                        " next_track_id=%u\n",
                        mvhd->timescale, seconds,
                        mp4_time_to_unix_seconds(mvhd->creation_time),
                        mvhd->next_track_id);
        }

        const std::vector<TrackBox> tracks = movie.tracks();
        std::printf("  tracks=%zu\n", tracks.size());
        for (size_t t = 0; t < tracks.size(); ++t) {
            print_track(t, tracks[t], list_samples, max_listed,
                        read_options.sample_limits);
        }
    }

    return any_failed ? 1 : 0;
}
