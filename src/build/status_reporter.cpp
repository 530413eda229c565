#include <mxpack/build/status_reporter.hpp>
#include <mxpack/build/problems.hpp>
#include <mxpack/log.hpp>

#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace mxpack {

BuildStatusReporter::BuildStatusReporter(const Settings& settings, ProcessRunner& runner,
                                         fs::path temp_dir)
    : settings_(settings), runner_(runner), temp_dir_(std::move(temp_dir)) {}

std::string BuildStatusReporter::payload_for(const fs::path& error_file) {
    std::error_code ec;
    if (fs::is_regular_file(error_file, ec)) {
        std::ifstream in(error_file, std::ios::binary);
        std::ostringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }
    return generic_problems_payload();
}

Status BuildStatusReporter::report(const fs::path& error_file) {
    if (!settings_.build_status_callback_url) {
        log::warn("no BUILD_STATUS_CALLBACK_URL set, not submitting build status");
        return ok_status();
    }
    const std::string& url = *settings_.build_status_callback_url;

    // curl sends the body from a file so the bytes go out unchanged
    fs::path body = error_file;
    std::error_code ec;
    if (!fs::is_regular_file(error_file, ec)) {
        body = temp_dir_ / "mxpack-build-status.json";
        std::ofstream out(body, std::ios::binary | std::ios::trunc);
        out << generic_problems_payload();
        if (!out) {
            return PackError{PackError::IO, "cannot write " + body.string()};
        }
    }

    log::info("submitting build status");
    Command cmd;
    cmd.args = {"curl", "--fail", "--silent", "--show-error",
                "--request", "PUT",
                "--header", "Content-Type: application/json",
                "--data-binary", "@" + body.string(),
                url};
    cmd.timeout_seconds = 60;

    auto r = runner_.run(cmd);
    if (r.is_err()) return std::move(r).error();
    if (r.value().exit_code != 0) {
        return PackError{PackError::Network,
            "build status submission failed: " + r.value().stderr_str};
    }
    log::info("submitted build status");
    return ok_status();
}

} // namespace mxpack
