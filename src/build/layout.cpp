#include <mxpack/build/layout.hpp>
#include <mxpack/log.hpp>

#include <algorithm>

namespace fs = std::filesystem;

namespace mxpack {

const std::vector<std::string>& target_layout_dirs() {
    static const std::vector<std::string> dirs = {
        ".local",
        ".local/bin",
        "runtimes",
        "log",
        "database",
        "data",
        "data/files",
        "data/tmp",
        "bin",
    };
    return dirs;
}

Status ensure_layout(const fs::path& root) {
    log::debug("making directory structure in %s", root.c_str());
    for (const auto& rel : target_layout_dirs()) {
        std::error_code ec;
        fs::create_directories(root / rel, ec);
        if (ec || !fs::is_directory(root / rel)) {
            return PackError{PackError::Assembly,
                "cannot create " + (root / rel).string() +
                (ec ? ": " + ec.message() : ": not a directory")};
        }
    }
    return ok_status();
}

const std::vector<StaticResource>& static_resources() {
    static const std::vector<StaticResource> resources = {
        {"etc", ".local/etc", false},
        {"lib", "lib", false},
        {"start", "start", false},
        {"newrelic", "newrelic", true},
    };
    return resources;
}

Status replace_tree(const fs::path& source, const fs::path& target) {
    std::error_code ec;
    if (!fs::exists(source, ec)) {
        return PackError{PackError::Assembly,
            "buildpack resource missing: " + source.string()};
    }

    fs::remove_all(target, ec);
    if (ec) {
        return PackError{PackError::Assembly,
            "cannot remove " + target.string() + ": " + ec.message()};
    }
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
        return PackError{PackError::Assembly,
            "cannot create " + target.parent_path().string() + ": " + ec.message()};
    }

    fs::copy(source, target,
             fs::copy_options::recursive | fs::copy_options::copy_symlinks, ec);
    if (ec) {
        return PackError{PackError::Assembly,
            "cannot copy " + source.string() + " to " + target.string() + ": " + ec.message()};
    }
    return ok_status();
}

Status copy_static_resources(const fs::path& buildpack_root, const fs::path& root,
                             bool with_monitor_agent) {
    for (const auto& res : static_resources()) {
        if (res.optional_monitor_agent && !with_monitor_agent) continue;
        log::debug("copying %s -> %s", res.source.c_str(), res.target.c_str());
        MXPACK_TRY(replace_tree(buildpack_root / res.source, root / res.target));
    }
    return ok_status();
}

Result<std::vector<std::string>> sweep_children(const fs::path& root,
                                                const std::set<std::string>& keep) {
    std::vector<std::string> removed;
    std::error_code ec;
    fs::directory_iterator it(root, ec);
    if (ec) {
        return PackError{PackError::IO,
            "cannot list " + root.string() + ": " + ec.message()};
    }

    std::vector<fs::path> children;
    for (const auto& entry : it) {
        children.push_back(entry.path());
    }

    for (const auto& child : children) {
        std::string name = child.filename().string();
        if (keep.count(name)) continue;
        fs::remove_all(child, ec);
        if (ec) {
            return PackError{PackError::IO,
                "cannot remove " + child.string() + ": " + ec.message()};
        }
        removed.push_back(name);
    }

    std::sort(removed.begin(), removed.end());
    return Result<std::vector<std::string>>::ok(std::move(removed));
}

Status replace_symlink(const fs::path& target, const fs::path& link) {
    std::error_code ec;
    fs::create_directories(link.parent_path(), ec);
    if (fs::is_symlink(link, ec)) {
        fs::remove(link, ec);
    } else if (fs::exists(link, ec)) {
        fs::remove_all(link, ec);
    }
    if (ec) {
        return PackError{PackError::Assembly,
            "cannot replace " + link.string() + ": " + ec.message()};
    }
    fs::create_symlink(target, link, ec);
    if (ec) {
        return PackError{PackError::Assembly,
            "cannot link " + link.string() + " -> " + target.string() + ": " + ec.message()};
    }
    return ok_status();
}

} // namespace mxpack
