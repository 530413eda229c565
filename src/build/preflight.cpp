#include <mxpack/build/preflight.hpp>
#include <mxpack/log.hpp>

namespace mxpack {

const std::vector<PreflightChecker::Check>& PreflightChecker::checks() {
    static const std::vector<Check> table = {
        {"DATABASE_URL",
         [](const Settings& s) { return s.database_url.has_value(); },
         "You should provide a DATABASE_URL by adding a database service to this "
         "application, it can be either MySQL or Postgres. If this is the first push "
         "of a new app, set up a database service and push again afterwards."},
        {"ADMIN_PASSWORD",
         [](const Settings& s) { return s.admin_password.has_value(); },
         "You should provide an ADMIN_PASSWORD environment variable"},
    };
    return table;
}

std::vector<std::string> PreflightChecker::missing(const Settings& settings) const {
    std::vector<std::string> names;
    for (const auto& c : checks()) {
        if (!c.present(settings)) names.push_back(c.name);
    }
    return names;
}

bool PreflightChecker::check(const Settings& settings) const {
    log::debug("pre-flight check");
    bool ok = true;
    // Every check runs so that all problems show up in one push
    for (const auto& c : checks()) {
        if (!c.present(settings)) {
            log::warn("%s", c.warning);
            ok = false;
        }
    }
    return ok;
}

Status PreflightChecker::require(const Settings& settings) const {
    if (check(settings)) return ok_status();

    std::string names;
    for (const auto& n : missing(settings)) {
        if (!names.empty()) names += ", ";
        names += n;
    }
    return PackError{PackError::Config,
        "missing environment variables: " + names,
        "set them on the application and push again"};
}

} // namespace mxpack
