#pragma once

#include <mxpack/dependencies.hpp>
#include <mxpack/settings.hpp>
#include <mxpack/version.hpp>
#include <filesystem>

namespace mxpack {

// Component names used in dependencies.toml
namespace component {
constexpr const char* MONO = "mono";            // runtime for the model compiler
constexpr const char* COMPILER = "mxbuild";     // model compiler
constexpr const char* JDK = "jdk";              // development kit for the compiler
constexpr const char* JRE = "jre";              // Java runtime for the application
constexpr const char* RUNTIME = "runtime";      // managed application runtime
constexpr const char* NGINX = "nginx";          // web-serving front end
constexpr const char* APPDYNAMICS = "appdynamics";
}

struct BuildPaths {
    std::filesystem::path build_dir;
    std::filesystem::path cache_dir;
    std::filesystem::path buildpack_dir;
    std::filesystem::path base_image_root = "/";
    std::filesystem::path temp_dir;
};

// Everything a pipeline stage may know about the current invocation.
// Built once after preflight and version resolution, then only handed out
// as a const reference.
struct BuildContext {
    BuildPaths paths;
    Settings settings;
    DependencyManifest dependencies;
    Version runtime_version;

    // Local-tools subtree; survives the post-compile sweep
    std::filesystem::path dot_local() const { return paths.build_dir / ".local"; }

    std::filesystem::path model_package_path() const { return paths.temp_dir / "model.mda"; }
    std::filesystem::path build_errors_path() const { return paths.temp_dir / "builderrors.json"; }

    // Forced-URL downloads go here instead of the shared cache
    std::filesystem::path throwaway_cache_dir() const { return paths.temp_dir / "mxpack-downloads"; }
};

} // namespace mxpack
