// mxpack: compile step of the buildpack.
//
//     mxpack <build-dir> <cache-dir>
//
// Turns a pushed application (model source or built package) in <build-dir>
// into a runnable droplet, caching downloaded archives in <cache-dir>.

#include <mxpack/build/pipeline.hpp>
#include <mxpack/log.hpp>
#include <mxpack/process.hpp>
#include <mxpack/settings.hpp>

#include <filesystem>

namespace fs = std::filesystem;
using namespace mxpack;

// <buildpack>/bin/mxpack -> <buildpack>
static fs::path buildpack_dir(const EnvMap& env, const char* argv0) {
    auto it = env.find("MXPACK_BUILDPACK_DIR");
    if (it != env.end() && !it->second.empty()) return it->second;

    std::error_code ec;
    fs::path exe = fs::read_symlink("/proc/self/exe", ec);
    if (ec) exe = fs::absolute(argv0, ec);
    return exe.parent_path().parent_path();
}

static Result<fs::path> existing_dir(const char* arg, const char* what) {
    std::error_code ec;
    fs::path p = fs::absolute(arg, ec);
    if (ec || !fs::is_directory(p, ec)) {
        return PackError{PackError::InvalidArg,
            std::string(what) + " is not a directory: " + arg};
    }
    return Result<fs::path>::ok(p.lexically_normal());
}

int main(int argc, char** argv) {
    if (argc != 3) {
        log::error("usage: %s <build-dir> <cache-dir>", argc > 0 ? argv[0] : "mxpack");
        return 2;
    }

    EnvMap env = capture_environment();
    Settings settings = Settings::from_env(env);
    log::set_level(settings.log_level);

    auto build_dir = existing_dir(argv[1], "build directory");
    if (build_dir.is_err()) {
        log::error("%s", build_dir.error().format().c_str());
        return 2;
    }

    std::error_code ec;
    fs::path cache_dir = fs::absolute(argv[2], ec).lexically_normal();
    fs::create_directories(cache_dir, ec);
    if (ec) {
        log::error("cannot create cache directory %s: %s", argv[2], ec.message().c_str());
        return 1;
    }

    BuildPaths paths;
    paths.build_dir = build_dir.value();
    paths.cache_dir = cache_dir;
    paths.buildpack_dir = buildpack_dir(env, argv[0]);
    paths.temp_dir = fs::temp_directory_path(ec);
    if (ec) paths.temp_dir = "/tmp";

    log::debug("buildpack at %s", paths.buildpack_dir.c_str());

    auto manifest = DependencyManifest::load(paths.buildpack_dir / "dependencies.toml");
    if (manifest.is_err()) {
        auto e = std::move(manifest).error();
        e.code = PackError::Config;
        log::error("%s", e.format().c_str());
        return 1;
    }

    SubprocessRunner runner;
    CommandFetcher fetcher(runner);
    PipelineCoordinator pipeline(
        PipelineInputs{paths, settings, std::move(manifest).value()}, runner, fetcher);

    auto result = pipeline.run();
    if (result.is_err()) {
        log::error("%s", result.error().format().c_str());
        log::error("compile failed in stage %s",
                   pipeline_state_name(pipeline.history().size() > 1
                       ? pipeline.history()[pipeline.history().size() - 2]
                       : pipeline.state()));
        return 1;
    }
    return 0;
}
