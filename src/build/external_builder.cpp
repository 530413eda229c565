#include <mxpack/build/external_builder.hpp>
#include <mxpack/build/layout.hpp>
#include <mxpack/build/problems.hpp>
#include <mxpack/build/version_resolver.hpp>
#include <mxpack/log.hpp>

namespace fs = std::filesystem;

namespace mxpack {

const char* const WRITE_ERRORS_MIN_VERSION = "6.4.0";

const std::set<std::string>& preserved_build_entries() {
    static const std::set<std::string> keep = {".local"};
    return keep;
}

ExternalBuilder::ExternalBuilder(const BuildContext& ctx, ArtifactCache& cache,
                                 ArtifactFetcher& fetcher, ProcessRunner& runner)
    : ctx_(ctx), cache_(cache), fetcher_(fetcher), runner_(runner) {}

bool ExternalBuilder::writes_build_errors(const Version& toolchain, bool forced) {
    if (forced) return true;
    return toolchain >= Version::parse(WRITE_ERRORS_MIN_VERSION).value();
}

Result<CompilerToolchain> ExternalBuilder::prepare_toolchain() {
    log::debug("preparing mxbuild");
    CompilerToolchain tc;

    auto mono = cache_.ensure(component::MONO);
    if (mono.is_err()) return std::move(mono).error();
    tc.mono = mono.value();
    log::info("mono available at %s", tc.mono.c_str());

    auto mxbuild = cache_.ensure(component::COMPILER);
    if (mxbuild.is_err()) return std::move(mxbuild).error();
    tc.mxbuild = mxbuild.value();

    auto jdk = cache_.ensure(component::JDK);
    if (jdk.is_err()) return std::move(jdk).error();
    tc.jdk = jdk.value();
    log::info("JDK available at %s", tc.jdk.c_str());

    return Result<CompilerToolchain>::ok(std::move(tc));
}

Command ExternalBuilder::compiler_command(const CompilerToolchain& tc,
                                          const fs::path& project_file) const {
    Command cmd;
    cmd.args = {
        (tc.mono / "bin" / "mono").string(),
        "--config", (tc.mono / "etc" / "mono" / "config").string(),
        (tc.mxbuild / "modeler" / "mxbuild.exe").string(),
        "--target=package",
        "--output=" + ctx_.model_package_path().string(),
        "--java-home=" + tc.jdk.string(),
        "--java-exe-path=" + (tc.jdk / "bin" / "java").string(),
    };

    if (writes_build_errors(ctx_.runtime_version, ctx_.settings.force_write_build_errors)) {
        cmd.args.push_back("--write-errors=" + ctx_.build_errors_path().string());
        log::debug("will write build errors to %s", ctx_.build_errors_path().c_str());
    }

    if (ctx_.settings.forced_compiler_url) {
        cmd.args.push_back("--loose-version-check");
        log::warn("FORCED_MXBUILD_URL is set, passing --loose-version-check");
    }

    cmd.args.push_back(project_file.string());

    std::string lib = (tc.mono / "lib").string();
    if (ctx_.settings.library_path && !ctx_.settings.library_path->empty()) {
        lib += ":" + *ctx_.settings.library_path;
    }
    cmd.env["LD_LIBRARY_PATH"] = lib;
    cmd.working_dir = ctx_.paths.build_dir.string();
    return cmd;
}

Result<BuildArtifact> ExternalBuilder::build() {
    auto project = find_project_file(ctx_.paths.build_dir);
    if (!project) {
        return PackError{PackError::NotFound,
            "no project file (.mpr) in " + ctx_.paths.build_dir.string()};
    }

    auto tc = prepare_toolchain();
    if (tc.is_err()) return std::move(tc).error();

    std::error_code ec;
    fs::remove(ctx_.build_errors_path(), ec);
    fs::remove(ctx_.model_package_path(), ec);

    Command cmd = compiler_command(tc.value(), *project);
    log::info("building the model with mxbuild %s",
              ctx_.runtime_version.to_string().c_str());

    auto run = runner_.run(cmd);
    if (run.is_err()) return std::move(run).error();

    const CommandResult& res = run.value();
    if (!res.stdout_str.empty()) log::debug("%s", res.stdout_str.c_str());

    if (res.exit_code != 0) {
        if (!res.stderr_str.empty()) log::error("%s", res.stderr_str.c_str());
        auto problems = load_problems_or_generic(ctx_.build_errors_path());
        for (const auto& p : problems) {
            log::error("%s", p.to_string().c_str());
        }
        return PackError::compile_failed(
            "mxbuild exited with status " + std::to_string(res.exit_code),
            std::move(problems));
    }

    if (!fs::is_regular_file(ctx_.model_package_path(), ec)) {
        return PackError::compile_failed(
            "mxbuild reported success but wrote no package at " +
            ctx_.model_package_path().string(),
            {generic_build_error()});
    }

    MXPACK_TRY(install_package(ctx_.model_package_path()));

    return Result<BuildArtifact>::ok(BuildArtifact{*project, ctx_.model_package_path()});
}

// Unpack into a staging directory inside the preserved subtree, then swap
// it in: the old contents are only swept once the new ones are complete.
Status ExternalBuilder::install_package(const fs::path& package) {
    fs::path staging = ctx_.dot_local() / "package-staging";
    std::error_code ec;
    fs::remove_all(staging, ec);

    auto unpacked = fetcher_.unpack(package, staging).with_code(PackError::Assembly);
    if (unpacked.is_err()) {
        fs::remove_all(staging, ec);
        return std::move(unpacked).error();
    }

    auto removed = sweep_children(ctx_.paths.build_dir, preserved_build_entries())
                       .with_code(PackError::Assembly);
    if (removed.is_err()) return std::move(removed).error();
    log::debug("removed %zu stale entries from the build root", removed.value().size());

    fs::directory_iterator it(staging, ec);
    if (ec) {
        return PackError{PackError::Assembly,
            "cannot list unpacked package at " + staging.string() + ": " + ec.message()};
    }
    std::vector<fs::path> entries;
    for (const auto& entry : it) {
        entries.push_back(entry.path());
    }

    for (const auto& entry : entries) {
        std::string name = entry.filename().string();
        if (preserved_build_entries().count(name)) {
            log::warn("package entry '%s' clashes with the local-tools subtree, skipping",
                      name.c_str());
            continue;
        }
        fs::rename(entry, ctx_.paths.build_dir / name, ec);
        if (ec) {
            return PackError{PackError::Assembly,
                "cannot move " + name + " into the build root: " + ec.message()};
        }
    }

    fs::remove_all(staging, ec);
    return ok_status();
}

Status ExternalBuilder::release_toolchain() {
    const char* compile_only[] = {component::COMPILER, component::MONO, component::JDK};
    fs::path local = ctx_.dot_local().lexically_normal();

    for (const char* name : compile_only) {
        auto path = cache_.install_path(name);
        if (path.is_err()) return std::move(path).error();

        fs::path p = path.value().lexically_normal();
        auto rel = p.lexically_relative(local);
        if (rel.empty() || rel.begin()->string() == "..") {
            // Only the local-tools subtree is ours to clean
            continue;
        }

        std::error_code ec;
        fs::remove_all(p, ec);
        if (ec) {
            return PackError{PackError::Assembly,
                "cannot remove " + p.string() + ": " + ec.message()};
        }
        log::debug("released %s", p.c_str());
    }
    return ok_status();
}

} // namespace mxpack
