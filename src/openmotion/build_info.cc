#include "openmotion/build_info.h"

#include "openmotion/build_info_generated.h"

#include <nlohmann/json.hpp>

#include <string>

#define OPENMOTION_STRINGIFY_IMPL(x) #x
#define OPENMOTION_STRINGIFY(x) OPENMOTION_STRINGIFY_IMPL(x)
#define OPENMOTION_JSON_VERSION                           \
    OPENMOTION_STRINGIFY(NLOHMANN_JSON_VERSION_MAJOR)     \
    "." OPENMOTION_STRINGIFY(NLOHMANN_JSON_VERSION_MINOR) \
    "." OPENMOTION_STRINGIFY(NLOHMANN_JSON_VERSION_PATCH)

namespace openmotion {
namespace {

    static constexpr BuildInfo kBuildInfo = {
        /*version=*/OPENMOTION_BUILDINFO_VERSION,
        /*build_timestamp_utc=*/OPENMOTION_BUILDINFO_BUILD_TIMESTAMP_UTC,
        /*build_type=*/OPENMOTION_BUILDINFO_BUILD_TYPE,
        /*cmake_generator=*/OPENMOTION_BUILDINFO_CMAKE_GENERATOR,
        /*system_name=*/OPENMOTION_BUILDINFO_SYSTEM_NAME,
        /*system_processor=*/OPENMOTION_BUILDINFO_SYSTEM_PROCESSOR,
        /*cxx_compiler_id=*/OPENMOTION_BUILDINFO_CXX_COMPILER_ID,
        /*cxx_compiler_version=*/OPENMOTION_BUILDINFO_CXX_COMPILER_VERSION,
        /*cxx_compiler=*/OPENMOTION_BUILDINFO_CXX_COMPILER,
        /*codecs=*/"camm,gpmf,blackvue",
        /*json_version=*/OPENMOTION_JSON_VERSION,
        /*gpmf_parser_library=*/OPENMOTION_BUILDINFO_GPMF_PARSER_LIBRARY,
    };

}  // namespace

const BuildInfo&
build_info() noexcept
{
    return kBuildInfo;
}


std::string
build_info_line1(const BuildInfo& bi)
{
    std::string out = "OpenMotion v";
    out += bi.version;
    if (!bi.build_type.empty()) {
        out += ' ';
        out += bi.build_type;
    }
    out += " [";
    out += bi.codecs;
    out += ']';
    return out;
}


// Compiler and target, then the third-party libraries compiled in.
std::string
build_info_line2(const BuildInfo& bi)
{
    std::string out = "built with ";
    out += bi.cxx_compiler_id;
    out += '-';
    out += bi.cxx_compiler_version;
    out += " for ";
    out += bi.system_name;
    out += '/';
    out += bi.system_processor;
    if (!bi.json_version.empty()) {
        out += ", nlohmann_json ";
        out += bi.json_version;
    }
    if (!bi.gpmf_parser_library.empty()) {
        out += ", ";
        out += bi.gpmf_parser_library;
    }
    if (!bi.build_timestamp_utc.empty()) {
        out += " (";
        out += bi.build_timestamp_utc;
        out += ')';
    }
    return out;
}


void
format_build_info_lines(std::string* line1, std::string* line2)
{
    if (line1) {
        *line1 = build_info_line1(build_info());
    }
    if (line2) {
        *line2 = build_info_line2(build_info());
    }
}

}  // namespace openmotion
