#include "openmotion/blackvue.h"
#include "openmotion/build_info.h"
#include "openmotion/camm.h"
#include "openmotion/file_source.h"
#include "openmotion/gpmf.h"
#include "openmotion/gps_filter.h"
#include "openmotion/resource_policy.h"

#include <nanobind/nanobind.h>
#include <nanobind/stl/optional.h>
#include <nanobind/stl/pair.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/variant.h>
#include <nanobind/stl/vector.h>

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace nb = nanobind;
using namespace nb::literals;

namespace openmotion {
namespace {

    static nb::str sv_to_py(std::string_view s)
    {
        return nb::str(s.data(), s.size());
    }


    static std::pair<std::string, std::string> info_lines()
    {
        std::string line1;
        std::string line2;
        format_build_info_lines(&line1, &line2);
        return { std::move(line1), std::move(line2) };
    }


    static void open_checked(FileSource* file, const std::string& path,
                             uint64_t max_file_bytes)
    {
        const FileStatus st = file->open(path.c_str());
        if (st != FileStatus::Ok) {
            throw std::runtime_error("failed to open file: " + path);
        }
        if (max_file_bytes != 0U && file->size() > max_file_bytes) {
            throw std::runtime_error("file exceeds max_file_bytes: " + path);
        }
    }


    // NotFound is an empty result; every other failure raises.
    static bool check_telemetry(TelemetryStatus status, const char* what)
    {
        if (status == TelemetryStatus::Ok) {
            return true;
        }
        if (status == TelemetryStatus::NotFound) {
            return false;
        }
        std::string msg(what);
        msg.append(": ");
        msg.append(telemetry_status_name(status));
        throw std::runtime_error(msg);
    }


    static Mp4ReadOptions
    read_options_from(const OpenMotionResourcePolicy& policy)
    {
        Mp4ReadOptions options;
        apply_resource_policy(policy, &options, nullptr);
        return options;
    }


    static std::vector<TelemetryMeasurement>
    camm_points_from_file(const std::string& path,
                          const OpenMotionResourcePolicy& policy)
    {
        std::vector<TelemetryMeasurement> out;
        TelemetryStatus st = TelemetryStatus::Ok;
        {
            nb::gil_scoped_release gil_release;
            FileSource file;
            open_checked(&file, path, policy.max_file_bytes);
            st = extract_camm_points(file, &out, read_options_from(policy));
        }
        if (!check_telemetry(st, "CAMM extraction failed")) {
            out.clear();
        }
        return out;
    }


    static std::vector<GpsPoint>
    gpmf_points_from_file(const std::string& path, bool filter,
                          const OpenMotionResourcePolicy& policy)
    {
        std::vector<GpsPoint> out;
        TelemetryStatus st = TelemetryStatus::Ok;
        {
            nb::gil_scoped_release gil_release;
            FileSource file;
            open_checked(&file, path, policy.max_file_bytes);
            st = extract_gpmf_points(file, &out, read_options_from(policy));
            if (st == TelemetryStatus::Ok && filter) {
                out = remove_noisy_points(out, policy.gps_filter);
            }
        }
        if (!check_telemetry(st, "GPMF extraction failed")) {
            out.clear();
        }
        return out;
    }


    static nb::object
    blackvue_info_from_file(const std::string& path,
                            const OpenMotionResourcePolicy& policy)
    {
        BlackVueInfo info;
        TelemetryStatus st = TelemetryStatus::Ok;
        {
            nb::gil_scoped_release gil_release;
            FileSource file;
            open_checked(&file, path, policy.max_file_bytes);
            st = extract_blackvue_info(file, &info, policy.box_limits);
        }
        if (!check_telemetry(st, "BlackVue extraction failed")) {
            return nb::none();
        }
        return nb::cast(std::move(info));
    }


    static OpenMotionResourcePolicy policy_or_default(nb::object policy_obj)
    {
        if (policy_obj.is_none()) {
            return recommended_resource_policy();
        }
        return nb::cast<OpenMotionResourcePolicy>(policy_obj);
    }

}  // namespace
}  // namespace openmotion


NB_MODULE(_openmotion, m)
{
    using namespace openmotion;

    m.doc() = "OpenMotion: MP4 camera motion metadata (CAMM, GPMF, BlackVue)";

    nb::enum_<GpsFix>(m, "GpsFix")
        .value("NoFix", GpsFix::NoFix)
        .value("Fix2D", GpsFix::Fix2D)
        .value("Fix3D", GpsFix::Fix3D);

    nb::class_<Point>(m, "Point")
        .def(nb::init<>())
        .def_rw("time", &Point::time)
        .def_rw("lat", &Point::lat)
        .def_rw("lon", &Point::lon)
        .def_rw("alt", &Point::alt)
        .def_rw("angle", &Point::angle);

    nb::class_<GpsPoint>(m, "GpsPoint")
        .def(nb::init<>())
        .def_rw("time", &GpsPoint::time)
        .def_rw("lat", &GpsPoint::lat)
        .def_rw("lon", &GpsPoint::lon)
        .def_rw("alt", &GpsPoint::alt)
        .def_rw("angle", &GpsPoint::angle)
        .def_rw("epoch_time", &GpsPoint::epoch_time)
        .def_rw("fix", &GpsPoint::fix)
        .def_rw("precision", &GpsPoint::precision)
        .def_rw("ground_speed", &GpsPoint::ground_speed)
        .def("__repr__", [](const GpsPoint& p) {
            std::string s("GpsPoint(time=");
            s.append(std::to_string(p.time));
            s.append(", lat=");
            s.append(std::to_string(p.lat));
            s.append(", lon=");
            s.append(std::to_string(p.lon));
            s.append(")");
            return s;
        });

    nb::class_<CammGpsPoint>(m, "CammGpsPoint")
        .def(nb::init<>())
        .def_rw("time", &CammGpsPoint::time)
        .def_rw("lat", &CammGpsPoint::lat)
        .def_rw("lon", &CammGpsPoint::lon)
        .def_rw("alt", &CammGpsPoint::alt)
        .def_rw("angle", &CammGpsPoint::angle)
        .def_rw("time_gps_epoch", &CammGpsPoint::time_gps_epoch)
        .def_rw("gps_fix_type", &CammGpsPoint::gps_fix_type)
        .def_rw("horizontal_accuracy", &CammGpsPoint::horizontal_accuracy)
        .def_rw("vertical_accuracy", &CammGpsPoint::vertical_accuracy)
        .def_rw("velocity_east", &CammGpsPoint::velocity_east)
        .def_rw("velocity_north", &CammGpsPoint::velocity_north)
        .def_rw("velocity_up", &CammGpsPoint::velocity_up)
        .def_rw("speed_accuracy", &CammGpsPoint::speed_accuracy);

    nb::class_<AccelerationData>(m, "AccelerationData")
        .def(nb::init<>())
        .def_rw("time", &AccelerationData::time)
        .def_rw("x", &AccelerationData::x)
        .def_rw("y", &AccelerationData::y)
        .def_rw("z", &AccelerationData::z);

    nb::class_<GyroscopeData>(m, "GyroscopeData")
        .def(nb::init<>())
        .def_rw("time", &GyroscopeData::time)
        .def_rw("x", &GyroscopeData::x)
        .def_rw("y", &GyroscopeData::y)
        .def_rw("z", &GyroscopeData::z);

    nb::class_<MagnetometerData>(m, "MagnetometerData")
        .def(nb::init<>())
        .def_rw("time", &MagnetometerData::time)
        .def_rw("x", &MagnetometerData::x)
        .def_rw("y", &MagnetometerData::y)
        .def_rw("z", &MagnetometerData::z);

    nb::class_<BlackVueInfo>(m, "BlackVueInfo")
        .def_ro("make", &BlackVueInfo::make)
        .def_ro("model", &BlackVueInfo::model)
        .def_ro("gps", &BlackVueInfo::gps);

    nb::class_<BoxParseLimits>(m, "BoxParseLimits")
        .def(nb::init<>())
        .def_rw("max_depth", &BoxParseLimits::max_depth)
        .def_rw("max_boxes", &BoxParseLimits::max_boxes)
        .def_rw("max_box_data_bytes", &BoxParseLimits::max_box_data_bytes);

    nb::class_<SampleTableLimits>(m, "SampleTableLimits")
        .def(nb::init<>())
        .def_rw("max_samples", &SampleTableLimits::max_samples);

    nb::class_<GpsFilterOptions>(m, "GpsFilterOptions")
        .def(nb::init<>())
        .def_rw("accepted_fixes", &GpsFilterOptions::accepted_fixes)
        .def_rw("max_dop100", &GpsFilterOptions::max_dop100)
        .def_rw("gps_precision_m", &GpsFilterOptions::gps_precision_m);

    nb::class_<CammBuildOptions>(m, "CammBuildOptions")
        .def(nb::init<>())
        .def_rw("min_media_timescale", &CammBuildOptions::min_media_timescale);

    nb::class_<OpenMotionResourcePolicy>(m, "ResourcePolicy")
        .def(nb::init<>())
        .def_rw("max_file_bytes", &OpenMotionResourcePolicy::max_file_bytes)
        .def_rw("box_limits", &OpenMotionResourcePolicy::box_limits)
        .def_rw("sample_limits", &OpenMotionResourcePolicy::sample_limits)
        .def_rw("camm_build", &OpenMotionResourcePolicy::camm_build)
        .def_rw("gps_filter", &OpenMotionResourcePolicy::gps_filter);

    m.def("recommended_resource_policy", &recommended_resource_policy);

    m.def(
        "extract_camm_points",
        [](const std::string& path, nb::object policy) {
            return camm_points_from_file(path, policy_or_default(policy));
        },
        "path"_a, "policy"_a = nb::none());

    m.def(
        "extract_gpmf_points",
        [](const std::string& path, bool filter, nb::object policy) {
            return gpmf_points_from_file(path, filter,
                                         policy_or_default(policy));
        },
        "path"_a, "filter"_a = false, "policy"_a = nb::none());

    m.def(
        "extract_blackvue_info",
        [](const std::string& path, nb::object policy) {
            return blackvue_info_from_file(path, policy_or_default(policy));
        },
        "path"_a, "policy"_a = nb::none());

    m.def(
        "filter_gps_noise",
        [](const std::vector<GpsPoint>& points, nb::object options_obj) {
            GpsFilterOptions options;
            if (!options_obj.is_none()) {
                options = nb::cast<GpsFilterOptions>(options_obj);
            }
            return remove_noisy_points(points, options);
        },
        "points"_a, "options"_a = nb::none());

    m.def("build_info", []() {
        const BuildInfo& bi = build_info();
        nb::dict d;
        d["version"]              = sv_to_py(bi.version);
        d["build_timestamp_utc"]  = sv_to_py(bi.build_timestamp_utc);
        d["build_type"]           = sv_to_py(bi.build_type);
        d["cmake_generator"]      = sv_to_py(bi.cmake_generator);
        d["system_name"]          = sv_to_py(bi.system_name);
        d["system_processor"]     = sv_to_py(bi.system_processor);
        d["cxx_compiler_id"]      = sv_to_py(bi.cxx_compiler_id);
        d["cxx_compiler_version"] = sv_to_py(bi.cxx_compiler_version);
        d["cxx_compiler"]         = sv_to_py(bi.cxx_compiler);
        d["codecs"]               = sv_to_py(bi.codecs);
        d["json_version"]         = sv_to_py(bi.json_version);
        d["gpmf_parser_library"]  = sv_to_py(bi.gpmf_parser_library);
        return d;
    });

    m.def("build_info_lines", &info_lines);
}
