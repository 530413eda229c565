#pragma once

#include <mxpack/result.hpp>
#include <mxpack/version.hpp>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace mxpack {

using TemplateVars = std::map<std::string, std::string>;

// Substitute {{ name }} placeholders. Undefined names and unclosed braces
// are Parse errors.
Result<std::string> expand_template(const std::string& tmpl, const TemplateVars& vars);

// [[components.<name>.select]] row: toolchain requirement -> artifact version
struct SelectRule {
    VersionReq when;
    std::string version;
};

// [components.<name>] section
struct ComponentSpec {
    std::string name;
    std::string archive;    // archive file name template
    std::string url;        // absolute URL template; empty: blobstore + archive
    std::string prebaked;   // base-image path template, relative; empty: never prebaked
    std::string install;    // install path template, relative to the build dir
    int strip_components = 0;
    TemplateVars vars;      // extra static template variables
    std::vector<SelectRule> select;

    // Artifact version for a toolchain: first matching select row, or the
    // toolchain version itself when there are no rows.
    Result<std::string> select_version(const Version& toolchain) const;
};

// Parsed dependencies.toml
struct DependencyManifest {
    std::string blobstore_url;
    std::map<std::string, ComponentSpec> components;

    static Result<DependencyManifest> parse(const std::string& toml_str);
    static Result<DependencyManifest> load(const std::filesystem::path& path);

    Result<const ComponentSpec*> component(const std::string& name) const;
};

} // namespace mxpack
