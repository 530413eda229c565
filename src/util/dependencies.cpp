#include <mxpack/dependencies.hpp>
#include <toml++/toml.hpp>

#include <cstdint>
#include <fstream>
#include <sstream>

namespace mxpack {

// ---------------------------------------------------------------------------
// Templates
// ---------------------------------------------------------------------------

static std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t");
    return s.substr(start, end - start + 1);
}

Result<std::string> expand_template(const std::string& tmpl, const TemplateVars& vars) {
    std::string out;
    out.reserve(tmpl.size());
    size_t i = 0;

    while (i < tmpl.size()) {
        size_t open = tmpl.find("{{", i);
        if (open == std::string::npos) {
            out.append(tmpl, i, std::string::npos);
            break;
        }
        out.append(tmpl, i, open - i);

        size_t close = tmpl.find("}}", open + 2);
        if (close == std::string::npos) {
            return PackError(PackError::Parse,
                "unclosed '{{' in template '" + tmpl + "'");
        }

        std::string name = trim(tmpl.substr(open + 2, close - open - 2));
        auto it = vars.find(name);
        if (it == vars.end()) {
            std::string known;
            for (const auto& kv : vars) {
                if (!known.empty()) known += ", ";
                known += kv.first;
            }
            return PackError(PackError::Parse,
                "undefined variable '" + name + "' in template '" + tmpl + "'",
                known.empty() ? "no variables defined" : "available variables: " + known);
        }

        out += it->second;
        i = close + 2;
    }

    return Result<std::string>::ok(std::move(out));
}

// ---------------------------------------------------------------------------
// ComponentSpec
// ---------------------------------------------------------------------------

Result<std::string> ComponentSpec::select_version(const Version& toolchain) const {
    if (select.empty()) {
        return Result<std::string>::ok(toolchain.to_string());
    }

    // Requirements are written against release versions
    Version release = toolchain;
    release.label.clear();

    for (const auto& rule : select) {
        if (rule.when.matches(release)) {
            return Result<std::string>::ok(rule.version);
        }
    }
    return PackError{PackError::Artifact,
        "no " + name + " version for toolchain " + toolchain.to_string(),
        "add a [[components." + name + ".select]] row to dependencies.toml"};
}

// ---------------------------------------------------------------------------
// DependencyManifest
// ---------------------------------------------------------------------------

static Result<ComponentSpec> parse_component(const std::string& name,
                                             const toml::table& tbl) {
    ComponentSpec c;
    c.name = name;

    if (auto v = tbl["archive"].value<std::string>()) c.archive = *v;
    if (auto v = tbl["url"].value<std::string>()) c.url = *v;
    if (auto v = tbl["prebaked"].value<std::string>()) c.prebaked = *v;
    if (auto v = tbl["install"].value<std::string>()) c.install = *v;
    if (auto v = tbl["strip"].value<int64_t>()) c.strip_components = static_cast<int>(*v);

    if (c.archive.empty() && c.url.empty()) {
        return PackError{PackError::Parse,
            "component '" + name + "' needs an 'archive' or 'url'"};
    }
    if (c.install.empty()) {
        return PackError{PackError::Parse,
            "component '" + name + "' has no 'install' path"};
    }

    if (auto vars = tbl["vars"].as_table()) {
        for (const auto& [key, val] : *vars) {
            if (auto s = val.value<std::string>()) {
                c.vars[std::string(key)] = *s;
            }
        }
    }

    if (auto rows = tbl["select"].as_array()) {
        for (const auto& row : *rows) {
            auto rt = row.as_table();
            if (!rt) {
                return PackError{PackError::Parse,
                    "components." + name + ".select entries must be tables"};
            }
            auto when = (*rt)["when"].value<std::string>();
            auto version = (*rt)["version"].value<std::string>();
            if (!when || !version) {
                return PackError{PackError::Parse,
                    "components." + name + ".select entries need 'when' and 'version'"};
            }
            auto req = VersionReq::parse(*when);
            if (req.is_err()) {
                auto e = std::move(req).error();
                e.code = PackError::Parse;
                e.message = "components." + name + ": " + e.message;
                return e;
            }
            c.select.push_back(SelectRule{std::move(req).value(), *version});
        }
    }

    return Result<ComponentSpec>::ok(std::move(c));
}

Result<DependencyManifest> DependencyManifest::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return PackError{PackError::Parse,
            std::string("dependencies TOML parse error: ") + e.what()};
    }

    DependencyManifest m;
    if (auto v = doc["blobstore"]["url"].value<std::string>()) {
        m.blobstore_url = *v;
        while (!m.blobstore_url.empty() && m.blobstore_url.back() == '/') {
            m.blobstore_url.pop_back();
        }
    }

    if (auto comps = doc["components"].as_table()) {
        for (const auto& [key, val] : *comps) {
            auto tbl = val.as_table();
            if (!tbl) continue;
            std::string name(key);
            auto c = parse_component(name, *tbl);
            if (c.is_err()) return std::move(c).error();
            if (c.value().url.empty() && m.blobstore_url.empty()) {
                return PackError{PackError::Parse,
                    "component '" + name + "' has no 'url' and [blobstore] url is not set"};
            }
            m.components[name] = std::move(c).value();
        }
    }

    return Result<DependencyManifest>::ok(std::move(m));
}

Result<DependencyManifest> DependencyManifest::load(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return PackError{PackError::IO,
            "cannot open dependency manifest: " + path.string()};
    }
    std::ostringstream ss;
    ss << file.rdbuf();

    auto m = parse(ss.str());
    if (m.is_err()) {
        auto e = std::move(m).error();
        e.file = path.string();
        return e;
    }
    return m;
}

Result<const ComponentSpec*> DependencyManifest::component(const std::string& name) const {
    auto it = components.find(name);
    if (it == components.end()) {
        return PackError{PackError::Artifact,
            "component '" + name + "' is not declared in dependencies.toml"};
    }
    return Result<const ComponentSpec*>::ok(&it->second);
}

} // namespace mxpack
