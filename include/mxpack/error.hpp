#pragma once

#include <mxpack/build_error.hpp>
#include <string>
#include <vector>

namespace mxpack {

struct PackError {
    enum Code {
        IO,
        Parse,
        InvalidArg,
        NotFound,
        Network,
        Config,     // mandatory configuration missing
        Version,    // toolchain version unavailable
        Artifact,   // artifact could not be acquired
        Compile,    // external compiler failed
        Assembly    // target layout could not be written
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    // Compiler problems, in the order the compiler reported them (Compile only)
    std::vector<BuildError> problems;

    PackError() = default;
    PackError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    PackError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    PackError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    static PackError compile_failed(std::string msg, std::vector<BuildError> errs);

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace mxpack
