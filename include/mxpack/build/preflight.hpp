#pragma once

#include <mxpack/result.hpp>
#include <mxpack/settings.hpp>
#include <string>
#include <vector>

namespace mxpack {

// Mandatory configuration, checked before the build touches anything
class PreflightChecker {
public:
    struct Check {
        const char* name;
        bool (*present)(const Settings&);
        const char* warning;
    };

    static const std::vector<Check>& checks();

    // Runs every check, logging a warning for each missing value.
    // Returns true when all are present.
    bool check(const Settings& settings) const;

    // Names of the missing values, in check order
    std::vector<std::string> missing(const Settings& settings) const;

    // check(), turned into a Config error naming what is missing
    Status require(const Settings& settings) const;
};

} // namespace mxpack
