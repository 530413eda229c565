#include <mxpack/settings.hpp>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>

namespace mxpack {

static std::optional<std::string> non_empty(const EnvMap& env, const char* key) {
    auto it = env.find(key);
    if (it == env.end() || it->second.empty()) return std::nullopt;
    return it->second;
}

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool parse_bool_flag(const std::string& value) {
    std::string v = lower(value);
    return v == "true" || v == "1" || v == "yes" || v == "on";
}

static bool supported_database_url(const std::string& url) {
    static const char* schemes[] = {"postgres://", "postgresql://", "mysql://", "sqlserver://"};
    std::string l = lower(url);
    for (const char* scheme : schemes) {
        if (l.rfind(scheme, 0) == 0) return true;
    }
    return false;
}

std::optional<std::string> database_url_from_vcap(const std::string& vcap_json) {
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(vcap_json);
    } catch (const nlohmann::json::parse_error& e) {
        log::warn("ignoring unparseable VCAP_SERVICES: %s", e.what());
        return std::nullopt;
    }
    if (!doc.is_object()) return std::nullopt;

    // { "<label>": [ { "credentials": { "uri": "..." } }, ... ], ... }
    for (const auto& [label, instances] : doc.items()) {
        if (!instances.is_array()) continue;
        for (const auto& inst : instances) {
            if (!inst.is_object()) continue;
            auto creds = inst.find("credentials");
            if (creds == inst.end() || !creds->is_object()) continue;
            auto uri = creds->find("uri");
            if (uri == creds->end() || !uri->is_string()) continue;
            std::string url = uri->get<std::string>();
            if (supported_database_url(url)) {
                log::debug("database from bound service '%s'", label.c_str());
                return url;
            }
        }
    }
    return std::nullopt;
}

Settings Settings::from_env(const EnvMap& env) {
    Settings s;

    if (auto url = non_empty(env, "DATABASE_URL")) {
        if (supported_database_url(*url)) {
            s.database_url = url;
        } else {
            log::warn("DATABASE_URL has an unsupported scheme, ignoring it");
        }
    }
    if (!s.database_url) {
        if (auto vcap = non_empty(env, "VCAP_SERVICES")) {
            s.database_url = database_url_from_vcap(*vcap);
        }
    }

    s.admin_password = non_empty(env, "ADMIN_PASSWORD");
    s.forced_runtime_url = non_empty(env, "FORCED_MXRUNTIME_URL");
    s.forced_compiler_url = non_empty(env, "FORCED_MXBUILD_URL");
    if (auto v = non_empty(env, "FORCE_WRITE_BUILD_ERRORS")) {
        s.force_write_build_errors = parse_bool_flag(*v);
    }
    s.monitor_license_key = non_empty(env, "NEW_RELIC_LICENSE_KEY");
    if (auto v = non_empty(env, "APPDYNAMICS")) {
        s.appdynamics_enabled = parse_bool_flag(*v);
    }
    s.build_status_callback_url = non_empty(env, "BUILD_STATUS_CALLBACK_URL");
    if (auto v = non_empty(env, "CF_STACK")) {
        s.stack = *v;
    }
    s.library_path = non_empty(env, "LD_LIBRARY_PATH");

    if (auto v = non_empty(env, "BUILDPACK_XTRACE"); v && parse_bool_flag(*v)) {
        s.log_level = log::Debug;
    }
    if (auto v = non_empty(env, "MXPACK_LOG_LEVEL")) {
        if (auto lvl = log::parse_level(*v)) {
            s.log_level = *lvl;
        } else {
            log::warn("unknown MXPACK_LOG_LEVEL '%s', keeping %s",
                      v->c_str(), log::level_name(s.log_level));
        }
    }

    return s;
}

} // namespace mxpack
