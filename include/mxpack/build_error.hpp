#pragma once

#include <string>

namespace mxpack {

// One problem reported by the model compiler
struct BuildError {
    std::string severity;   // "Error", "Warning", ...
    std::string message;
    std::string location;   // empty when the compiler gave none

    std::string to_string() const {
        std::string s = severity + ": " + message;
        if (!location.empty()) {
            s += " (" + location + ")";
        }
        return s;
    }

    bool operator==(const BuildError& o) const {
        return severity == o.severity && message == o.message &&
               location == o.location;
    }
};

} // namespace mxpack
