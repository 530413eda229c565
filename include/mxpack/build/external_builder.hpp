#pragma once

#include <mxpack/build/artifact_cache.hpp>
#include <mxpack/build/context.hpp>
#include <mxpack/build/fetcher.hpp>
#include <mxpack/process.hpp>
#include <mxpack/result.hpp>
#include <filesystem>
#include <set>
#include <string>

namespace mxpack {

// First toolchain version whose compiler can write structured errors
extern const char* const WRITE_ERRORS_MIN_VERSION;

// Top-level entries of the build root that survive the post-compile sweep
const std::set<std::string>& preserved_build_entries();

// Locations of the compile-time toolchain
struct CompilerToolchain {
    std::filesystem::path mono;
    std::filesystem::path mxbuild;
    std::filesystem::path jdk;
};

struct BuildArtifact {
    std::filesystem::path project_file;
    std::filesystem::path package;
};

// Runs the model compiler on a source push and replaces the build root with
// the package it produced.
class ExternalBuilder {
public:
    ExternalBuilder(const BuildContext& ctx, ArtifactCache& cache,
                    ArtifactFetcher& fetcher, ProcessRunner& runner);

    // Compile errors come back as a Compile error carrying the problems
    Result<BuildArtifact> build();

    // Acquire mono, the compiler and the JDK
    Result<CompilerToolchain> prepare_toolchain();

    Command compiler_command(const CompilerToolchain& tc,
                             const std::filesystem::path& project_file) const;

    // Remove the compile-only toolchains from the local-tools subtree
    Status release_toolchain();

    static bool writes_build_errors(const Version& toolchain, bool forced);

private:
    Status install_package(const std::filesystem::path& package);

    const BuildContext& ctx_;
    ArtifactCache& cache_;
    ArtifactFetcher& fetcher_;
    ProcessRunner& runner_;
};

} // namespace mxpack
