#pragma once

#include <mxpack/result.hpp>
#include <string>
#include <vector>

namespace mxpack {

// Toolchain version: major.minor[.micro[.build]][-label]
// e.g. "6.4", "7.23.1", "7.23.1.55882", "8.0.0-beta"
struct Version {
    int major = 0;
    int minor = 0;
    int micro = 0;
    int build = -1;     // -1 when the version has no fourth component
    std::string label;  // e.g. "beta", empty for release

    static Result<Version> parse(const std::string& s);
    std::string to_string() const;

    bool operator==(const Version& o) const;
    bool operator!=(const Version& o) const;
    bool operator<(const Version& o) const;
    bool operator<=(const Version& o) const;
    bool operator>(const Version& o) const;
    bool operator>=(const Version& o) const;
};

// Partial version for requirements: "7", "7.2", "7.2.3"
struct PartialVersion {
    int major = 0;
    int minor = -1;  // -1 means unset
    int micro = -1;  // -1 means unset

    static Result<PartialVersion> parse(const std::string& s);
    std::string to_string() const;
};

enum class ConstraintOp {
    Exact,       // =7.2.3
    Caret,       // ^7.2.3 (same major)
    Tilde,       // ~7.2.3 (same major.minor)
    GreaterEq,   // >=7.2.3
    Greater,     // >7.2.3
    LessEq,      // <=7.2.3
    Less,        // <7.2.3
};

struct VersionConstraint {
    ConstraintOp op;
    PartialVersion version;

    bool matches(const Version& v) const;
    std::string to_string() const;
};

// Compound requirement: ">=6.0, <7.0"
struct VersionReq {
    std::vector<VersionConstraint> constraints;

    static Result<VersionReq> parse(const std::string& s);
    bool matches(const Version& v) const;
    std::string to_string() const;
};

} // namespace mxpack
