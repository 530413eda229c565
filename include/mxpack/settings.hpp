#pragma once

#include <mxpack/log.hpp>
#include <mxpack/process.hpp>
#include <optional>
#include <string>

namespace mxpack {

// Build options derived from the environment. Taken once from a snapshot
// at startup; nothing else in the pipeline reads the environment.
struct Settings {
    std::optional<std::string> database_url;
    std::optional<std::string> admin_password;

    std::optional<std::string> forced_runtime_url;   // FORCED_MXRUNTIME_URL
    std::optional<std::string> forced_compiler_url;  // FORCED_MXBUILD_URL
    bool force_write_build_errors = false;

    std::optional<std::string> monitor_license_key;  // NEW_RELIC_LICENSE_KEY
    bool appdynamics_enabled = false;

    std::optional<std::string> build_status_callback_url;

    std::string stack = "cflinuxfs3";
    std::optional<std::string> library_path;         // inherited LD_LIBRARY_PATH
    log::Level log_level = log::Info;

    static Settings from_env(const EnvMap& env);
};

// Database URL of the first bound service with a supported scheme, if any
std::optional<std::string> database_url_from_vcap(const std::string& vcap_json);

// true/1/yes/on, case-insensitive
bool parse_bool_flag(const std::string& value);

} // namespace mxpack
