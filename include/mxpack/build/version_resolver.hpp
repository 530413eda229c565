#pragma once

#include <mxpack/result.hpp>
#include <mxpack/version.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace mxpack {

// Where the toolchain version of a project is recorded. Sources are tried in
// order; a source that does not apply to a project yields nullopt and the
// next one is tried.
struct VersionSource {
    const char* name;
    Result<std::optional<Version>> (*read)(const std::filesystem::path& source_root);
};

class VersionResolver {
public:
    // model/metadata.json, then the project database
    static const std::vector<VersionSource>& sources();

    // Version error when no source yields a version
    Result<Version> resolve(const std::filesystem::path& source_root) const;
};

// "RuntimeVersion" of <root>/model/metadata.json; nullopt when the file or
// key is absent
Result<std::optional<Version>> read_metadata_version(const std::filesystem::path& source_root);

// _MetaData._ProductVersion of the project database; nullopt when the root
// has no project file
Result<std::optional<Version>> read_database_version(const std::filesystem::path& source_root);

// First *.mpr file (by name) directly under root
std::optional<std::filesystem::path> find_project_file(const std::filesystem::path& root);

} // namespace mxpack
