#pragma once

#include <string>
#include <string_view>

/**
 * \file build_info.h
 * \brief Runtime information about how OpenMotion was built.
 */

namespace openmotion {

/**
 * \brief OpenMotion build information.
 *
 * Values are compiled into the binary at build time.
 */
struct BuildInfo final {
    /// OpenMotion version string (e.g. "0.4.0").
    std::string_view version;

    /// Build timestamp in UTC (ISO-8601), or empty if not recorded.
    std::string_view build_timestamp_utc;

    /// Build type string (e.g. "Release", "Debug", "multi-config").
    std::string_view build_type;

    /// CMake generator used to configure the build (e.g. "Ninja").
    std::string_view cmake_generator;

    /// Target platform (e.g. "Linux", "Darwin", "Windows").
    std::string_view system_name;

    /// Target CPU architecture (e.g. "x86_64", "arm64").
    std::string_view system_processor;

    /// Compiler ID (e.g. "Clang", "GNU", "MSVC").
    std::string_view cxx_compiler_id;

    /// Compiler version string.
    std::string_view cxx_compiler_version;

    /// Compiler executable path, if available.
    std::string_view cxx_compiler;

    /// Telemetry codecs compiled in, comma separated.
    std::string_view codecs;

    /// nlohmann/json version (`major.minor.patch`) the library was built with.
    std::string_view json_version;

    /// File name of the linked gpmf-parser library.
    std::string_view gpmf_parser_library;
};

/// Returns build information for the linked OpenMotion library.
const BuildInfo&
build_info() noexcept;

/// `OpenMotion vX.Y.Z <build_type> [<codecs>]`
std::string
build_info_line1(const BuildInfo& info);

/**
 * \brief Toolchain, target and third-party libraries of a build.
 *
 * `built with <compiler>-<version> for <system>/<arch>[, nlohmann_json
 * <version>][, <gpmf-parser library>][ (<timestamp>)]`
 */
std::string
build_info_line2(const BuildInfo& info);

/// Both lines for the linked OpenMotion library.
void
format_build_info_lines(std::string* line1, std::string* line2);

}  // namespace openmotion
