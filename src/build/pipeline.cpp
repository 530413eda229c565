#include <mxpack/build/pipeline.hpp>
#include <mxpack/build/artifact_cache.hpp>
#include <mxpack/build/external_builder.hpp>
#include <mxpack/build/layout.hpp>
#include <mxpack/build/preflight.hpp>
#include <mxpack/build/status_reporter.hpp>
#include <mxpack/build/version_resolver.hpp>
#include <mxpack/log.hpp>

namespace fs = std::filesystem;

namespace mxpack {

const char* pipeline_state_name(PipelineState s) {
    switch (s) {
        case PipelineState::Init:        return "init";
        case PipelineState::Preflight:   return "preflight";
        case PipelineState::SourceBuild: return "source-build";
        case PipelineState::SkipBuild:   return "skip-build";
        case PipelineState::Assemble:    return "assemble";
        case PipelineState::Acquire:     return "acquire";
        case PipelineState::Finalize:    return "finalize";
        case PipelineState::Succeeded:   return "succeeded";
        case PipelineState::Failed:      return "failed";
    }
    return "unknown";
}

PipelineCoordinator::PipelineCoordinator(PipelineInputs inputs, ProcessRunner& runner,
                                         ArtifactFetcher& fetcher)
    : inputs_(std::move(inputs)), runner_(runner), fetcher_(fetcher) {}

void PipelineCoordinator::enter(PipelineState s) {
    log::debug("stage: %s", pipeline_state_name(s));
    state_ = s;
    history_.push_back(s);
}

Status PipelineCoordinator::run() {
    auto r = run_stages();
    if (r.is_err()) {
        enter(PipelineState::Failed);
        return r;
    }
    enter(PipelineState::Succeeded);
    return r;
}

Status PipelineCoordinator::run_stages() {
    enter(PipelineState::Preflight);
    MXPACK_TRY(PreflightChecker{}.require(inputs_.settings));

    auto version = VersionResolver{}.resolve(inputs_.paths.build_dir);
    if (version.is_err()) return std::move(version).error();
    log::info("runtime version %s", version.value().to_string().c_str());

    ctx_ = std::make_unique<const BuildContext>(BuildContext{
        inputs_.paths, inputs_.settings, inputs_.dependencies, version.value()});

    if (find_project_file(ctx_->paths.build_dir)) {
        enter(PipelineState::SourceBuild);
        MXPACK_TRY(source_build());
    } else {
        enter(PipelineState::SkipBuild);
        log::debug("no project file, treating the build dir as a built package");
    }

    enter(PipelineState::Assemble);
    MXPACK_TRY(assemble());

    enter(PipelineState::Acquire);
    MXPACK_TRY(acquire());

    enter(PipelineState::Finalize);
    log::info("buildpack compile completed");
    return ok_status();
}

Status PipelineCoordinator::source_build() {
    ArtifactCache cache(*ctx_, fetcher_);
    ExternalBuilder builder(*ctx_, cache, fetcher_, runner_);

    auto built = builder.build();
    if (built.is_err()) {
        if (built.error().code == PackError::Compile) {
            BuildStatusReporter reporter(ctx_->settings, runner_, ctx_->paths.temp_dir);
            auto reported = reporter.report(ctx_->build_errors_path());
            if (reported.is_err()) {
                log::warn("%s", reported.error().message.c_str());
            }
        }
        return std::move(built).error();
    }

    return builder.release_toolchain();
}

Status PipelineCoordinator::assemble() {
    const fs::path& root = ctx_->paths.build_dir;
    MXPACK_TRY(ensure_layout(root));
    return copy_static_resources(ctx_->paths.buildpack_dir, root,
                                 ctx_->settings.monitor_license_key.has_value());
}

Status PipelineCoordinator::acquire() {
    ArtifactCache cache(*ctx_, fetcher_);

    auto jre = cache.ensure(component::JRE);
    if (jre.is_err()) return std::move(jre).error();
    MXPACK_TRY(replace_symlink(jre.value() / "bin" / "java",
                               ctx_->dot_local() / "bin" / "java"));

    if (ctx_->settings.appdynamics_enabled) {
        auto agent = cache.ensure(component::APPDYNAMICS);
        if (agent.is_err()) return std::move(agent).error();
    }

    auto runtime_version = cache.version_for(component::RUNTIME);
    if (runtime_version.is_err()) return std::move(runtime_version).error();
    auto runtime_home = cache.install_path(component::RUNTIME);
    if (runtime_home.is_err()) return std::move(runtime_home).error();

    auto runtime_plan = cache.plan(component::RUNTIME, runtime_version.value(),
                                   runtime_home.value());
    if (runtime_plan.is_err()) return std::move(runtime_plan).error();
    std::error_code ec;
    if (runtime_plan.value().source != AcquireSource::BaseImage &&
        fs::is_symlink(runtime_home.value(), ec)) {
        // Link from an earlier run on an image that carried the runtime;
        // unpacking through it would write into the base image.
        fs::remove(runtime_home.value(), ec);
        if (ec) {
            return PackError{PackError::Assembly,
                "cannot remove stale runtime link " + runtime_home.value().string() +
                ": " + ec.message()};
        }
    }

    auto runtime = cache.ensure(component::RUNTIME, runtime_version.value(),
                                runtime_home.value());
    if (runtime.is_err()) return std::move(runtime).error();
    if (runtime.value() != runtime_home.value()) {
        // Prebaked runtime: expose it where the start script looks
        MXPACK_TRY(replace_symlink(runtime.value(), runtime_home.value()));
    }

    auto nginx = cache.ensure(component::NGINX);
    if (nginx.is_err()) return std::move(nginx).error();

    return ok_status();
}

} // namespace mxpack
