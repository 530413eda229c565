#pragma once

#include <mxpack/result.hpp>
#include <filesystem>
#include <set>
#include <string>
#include <vector>

namespace mxpack {

// Directories, relative to the build root, that exist after assembly
const std::vector<std::string>& target_layout_dirs();

// Create every target layout directory under root. Existing directories
// are fine.
Status ensure_layout(const std::filesystem::path& root);

// A static resource shipped with the buildpack
struct StaticResource {
    std::string source;   // relative to the buildpack root
    std::string target;   // relative to the build root
    bool optional_monitor_agent = false;
};

const std::vector<StaticResource>& static_resources();

// Copy the buildpack's static resources into root, replacing any previous
// copy entirely. The monitoring-agent tree is only copied when requested.
Status copy_static_resources(const std::filesystem::path& buildpack_root,
                             const std::filesystem::path& root,
                             bool with_monitor_agent);

// Replace target with a full copy of source (file or directory tree)
Status replace_tree(const std::filesystem::path& source,
                    const std::filesystem::path& target);

// Remove every immediate child of root whose name is not in keep.
// Returns the names removed, sorted.
Result<std::vector<std::string>> sweep_children(const std::filesystem::path& root,
                                                const std::set<std::string>& keep);

// Point link at target, replacing whatever link (or file) was there
Status replace_symlink(const std::filesystem::path& target,
                       const std::filesystem::path& link);

} // namespace mxpack
