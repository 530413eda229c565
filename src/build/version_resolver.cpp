#include <mxpack/build/version_resolver.hpp>
#include <mxpack/log.hpp>
#include <nlohmann/json.hpp>
#include <sqlite3.h>

#include <algorithm>
#include <fstream>
#include <sstream>
#include <type_traits>

namespace fs = std::filesystem;

namespace mxpack {

std::optional<fs::path> find_project_file(const fs::path& root) {
    std::error_code ec;
    fs::directory_iterator it(root, ec);
    if (ec) return std::nullopt;

    std::vector<fs::path> found;
    for (const auto& entry : it) {
        if (entry.is_regular_file(ec) && entry.path().extension() == ".mpr") {
            found.push_back(entry.path());
        }
    }
    if (found.empty()) return std::nullopt;
    std::sort(found.begin(), found.end());
    return found.front();
}

Result<std::optional<Version>> read_metadata_version(const fs::path& source_root) {
    fs::path path = source_root / "model" / "metadata.json";
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return Result<std::optional<Version>>::ok(std::nullopt);
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return PackError{PackError::IO, "cannot open " + path.string()};
    }
    std::ostringstream ss;
    ss << file.rdbuf();

    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(ss.str());
    } catch (const nlohmann::json::parse_error& e) {
        log::warn("ignoring unreadable %s: %s", path.c_str(), e.what());
        return Result<std::optional<Version>>::ok(std::nullopt);
    }

    auto it = doc.is_object() ? doc.find("RuntimeVersion") : doc.end();
    if (it == doc.end() || !it->is_string()) {
        log::warn("%s has no RuntimeVersion", path.c_str());
        return Result<std::optional<Version>>::ok(std::nullopt);
    }

    auto v = Version::parse(it->get<std::string>());
    if (v.is_err()) {
        auto e = std::move(v).error();
        e.file = path.string();
        return e;
    }
    return Result<std::optional<Version>>::ok(std::move(v).value());
}

namespace {

// Read-only connection, closed on scope exit
struct ProjectDatabase {
    sqlite3* db = nullptr;

    ProjectDatabase() = default;
    ~ProjectDatabase() {
        if (db) sqlite3_close(db);
    }

    ProjectDatabase(const ProjectDatabase&) = delete;
    ProjectDatabase& operator=(const ProjectDatabase&) = delete;

    Status open(const fs::path& path) {
        int rc = sqlite3_open_v2(path.c_str(), &db, SQLITE_OPEN_READONLY, nullptr);
        if (rc != SQLITE_OK) {
            std::string msg = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
            return PackError{PackError::IO,
                "cannot open project database " + path.string() + ": " + msg};
        }
        return ok_status();
    }

    Result<std::string> product_version() {
        sqlite3_stmt* stmt = nullptr;
        int rc = sqlite3_prepare_v2(db,
            "SELECT _ProductVersion FROM _MetaData LIMIT 1", -1, &stmt, nullptr);
        if (rc != SQLITE_OK) {
            std::string msg = sqlite3_errmsg(db);
            if (stmt) sqlite3_finalize(stmt);
            return PackError{PackError::Parse, "project database has no version record: " + msg};
        }

        rc = sqlite3_step(stmt);
        if (rc != SQLITE_ROW) {
            sqlite3_finalize(stmt);
            return PackError{PackError::Parse, "project database version record is empty"};
        }
        const unsigned char* text = sqlite3_column_text(stmt, 0);
        std::string value = text ? reinterpret_cast<const char*>(text) : "";
        sqlite3_finalize(stmt);
        return Result<std::string>::ok(std::move(value));
    }
};

static_assert(!std::is_copy_constructible<ProjectDatabase>::value &&
              !std::is_copy_assignable<ProjectDatabase>::value,
              "ProjectDatabase owns its connection");

} // namespace

Result<std::optional<Version>> read_database_version(const fs::path& source_root) {
    auto project = find_project_file(source_root);
    if (!project) {
        return Result<std::optional<Version>>::ok(std::nullopt);
    }

    ProjectDatabase pdb;
    MXPACK_TRY(pdb.open(*project));

    auto raw = pdb.product_version();
    if (raw.is_err()) {
        auto e = std::move(raw).error();
        e.file = project->string();
        return e;
    }

    auto v = Version::parse(raw.value());
    if (v.is_err()) {
        auto e = std::move(v).error();
        e.file = project->string();
        return e;
    }
    return Result<std::optional<Version>>::ok(std::move(v).value());
}

const std::vector<VersionSource>& VersionResolver::sources() {
    static const std::vector<VersionSource> table = {
        {"metadata descriptor", &read_metadata_version},
        {"project database", &read_database_version},
    };
    return table;
}

Result<Version> VersionResolver::resolve(const fs::path& source_root) const {
    for (const auto& source : sources()) {
        auto r = source.read(source_root);
        if (r.is_err()) {
            auto e = std::move(r).error();
            e.code = PackError::Version;
            return e;
        }
        if (r.value()) {
            log::debug("toolchain version %s from %s",
                       r.value()->to_string().c_str(), source.name);
            return Result<Version>::ok(*r.value());
        }
    }
    return PackError{PackError::Version,
        "cannot determine the runtime version of " + source_root.string(),
        "expected model/metadata.json with a RuntimeVersion, or a .mpr project file"};
}

} // namespace mxpack
