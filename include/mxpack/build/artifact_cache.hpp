#pragma once

#include <mxpack/build/context.hpp>
#include <mxpack/build/fetcher.hpp>
#include <mxpack/result.hpp>
#include <filesystem>
#include <optional>
#include <string>

namespace mxpack {

// Where an artifact comes from; rules are tried in this order
enum class AcquireSource {
    BaseImage,   // already unpacked in the runtime base image
    ForcedUrl,   // operator override, downloaded to a throwaway cache
    Blobstore,   // computed URL, downloaded to the shared cache
};

const char* acquire_source_name(AcquireSource s);

// Resolved decision for one (component, version)
struct AcquirePlan {
    std::string component;
    std::string version;
    AcquireSource source = AcquireSource::Blobstore;
    std::string url;                        // empty for BaseImage
    std::filesystem::path archive_path;     // cache entry; empty for BaseImage
    std::filesystem::path location;         // path handed back to the caller
};

// Archive store keyed by component and version.
//
// Layout:
//   <cache_dir>/<component>/<version>/<archive>         shared, persistent
//   <temp_dir>/mxpack-downloads/<component>/<archive>   forced URLs, throwaway
//
// An archive that exists with a non-zero size is trusted as is.
class ArtifactCache {
public:
    ArtifactCache(const BuildContext& ctx, ArtifactFetcher& fetcher);

    // Decide how (component, version) is acquired into destination.
    Result<AcquirePlan> plan(const std::string& component,
                             const std::string& version,
                             const std::filesystem::path& destination) const;

    // Make the artifact available and return where it lives: the base-image
    // path when prebaked, destination otherwise.
    Result<std::filesystem::path> ensure(const std::string& component,
                                         const std::string& version,
                                         const std::filesystem::path& destination);

    // Same, with version and destination taken from dependencies.toml
    Result<std::filesystem::path> ensure(const std::string& component);

    // Artifact version selected for the current toolchain
    Result<std::string> version_for(const std::string& component) const;

    // Install location under the build dir for the selected version
    Result<std::filesystem::path> install_path(const std::string& component) const;

    // Shared-cache archive path for (component, version, archive file name)
    std::filesystem::path cache_entry_path(const std::string& component,
                                           const std::string& version,
                                           const std::string& archive) const;

private:
    std::optional<std::string> forced_url_for(const std::string& name) const;
    TemplateVars template_vars(const ComponentSpec& spec, const std::string& version) const;

    const BuildContext& ctx_;
    ArtifactFetcher& fetcher_;
};

} // namespace mxpack
