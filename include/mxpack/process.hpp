#pragma once

#include <mxpack/result.hpp>
#include <map>
#include <string>
#include <vector>

namespace mxpack {

using EnvMap = std::map<std::string, std::string>;

// An external program invocation
struct Command {
    std::vector<std::string> args;  // args[0] is the program
    std::string working_dir;        // empty: inherit
    EnvMap env;                     // set on top of the inherited environment
    int timeout_seconds = 0;        // 0: wait until the process exits

    std::string to_string() const;
};

// Result of running an external command
struct CommandResult {
    int exit_code;
    std::string stdout_str;
    std::string stderr_str;
};

// Run an external command, capturing stdout and stderr.
// Returns error on fork/exec failure or timeout. A program that cannot be
// executed exits with 127.
Result<CommandResult> run_command(const Command& cmd);

// Seam between the pipeline and the operating system. Every external
// program (downloader, unpacker, compiler, callback) goes through it.
class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;
    virtual Result<CommandResult> run(const Command& cmd) = 0;
};

class SubprocessRunner : public ProcessRunner {
public:
    Result<CommandResult> run(const Command& cmd) override;
};

// Snapshot of the current process environment
EnvMap capture_environment();

} // namespace mxpack
