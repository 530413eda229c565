#pragma once

#include <mxpack/process.hpp>
#include <mxpack/result.hpp>
#include <mxpack/settings.hpp>
#include <filesystem>
#include <string>

namespace mxpack {

// Tells the platform why a build failed
class BuildStatusReporter {
public:
    BuildStatusReporter(const Settings& settings, ProcessRunner& runner,
                        std::filesystem::path temp_dir);

    // PUT the error file (verbatim) or the generic payload to the callback
    // URL. Without a callback URL this only logs.
    Status report(const std::filesystem::path& error_file);

    // The payload report() would send
    static std::string payload_for(const std::filesystem::path& error_file);

private:
    const Settings& settings_;
    ProcessRunner& runner_;
    std::filesystem::path temp_dir_;
};

} // namespace mxpack
