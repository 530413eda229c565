#pragma once

#include <mxpack/build/context.hpp>
#include <mxpack/build/fetcher.hpp>
#include <mxpack/process.hpp>
#include <mxpack/result.hpp>
#include <memory>
#include <vector>

namespace mxpack {

enum class PipelineState {
    Init,
    Preflight,
    SourceBuild,
    SkipBuild,
    Assemble,
    Acquire,
    Finalize,
    Succeeded,
    Failed,
};

const char* pipeline_state_name(PipelineState s);

// What the CLI knows before the pipeline starts
struct PipelineInputs {
    BuildPaths paths;
    Settings settings;
    DependencyManifest dependencies;
};

// Drives one compile of a build directory:
//   Preflight -> SourceBuild | SkipBuild -> Assemble -> Acquire -> Finalize
// Every error ends the run in Failed; nothing is retried.
class PipelineCoordinator {
public:
    PipelineCoordinator(PipelineInputs inputs, ProcessRunner& runner,
                        ArtifactFetcher& fetcher);

    Status run();

    PipelineState state() const { return state_; }
    const std::vector<PipelineState>& history() const { return history_; }

    // Available once the version has been resolved
    const BuildContext* context() const { return ctx_.get(); }

private:
    Status run_stages();
    Status source_build();
    Status assemble();
    Status acquire();
    void enter(PipelineState s);

    PipelineInputs inputs_;
    ProcessRunner& runner_;
    ArtifactFetcher& fetcher_;
    std::unique_ptr<const BuildContext> ctx_;
    PipelineState state_ = PipelineState::Init;
    std::vector<PipelineState> history_;
};

} // namespace mxpack
