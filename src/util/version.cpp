#include <mxpack/version.hpp>
#include <algorithm>
#include <cctype>
#include <sstream>

namespace mxpack {

// Strict decimal component: digits only, no sign, no trailing garbage
static bool parse_component(const std::string& s, int& out) {
    if (s.empty() || s.size() > 9) return false;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    out = std::stoi(s);
    return true;
}

static std::vector<std::string> split(const std::string& s, char sep) {
    std::vector<std::string> parts;
    std::string part;
    std::istringstream stream(s);
    while (std::getline(stream, part, sep)) {
        parts.push_back(part);
    }
    if (!s.empty() && s.back() == sep) parts.emplace_back();
    return parts;
}

// ---------------------------------------------------------------------------
// Version
// ---------------------------------------------------------------------------

Result<Version> Version::parse(const std::string& raw) {
    std::string s = raw;
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.pop_back();
    size_t first = 0;
    while (first < s.size() && std::isspace(static_cast<unsigned char>(s[first]))) ++first;
    s = s.substr(first);

    if (s.empty()) {
        return PackError{PackError::Version, "empty version string"};
    }

    Version v;
    std::string numeric = s;
    size_t dash = s.find('-');
    if (dash != std::string::npos) {
        numeric = s.substr(0, dash);
        v.label = s.substr(dash + 1);
        if (v.label.empty()) {
            return PackError{PackError::Version,
                "empty label after '-' in '" + s + "'"};
        }
    }

    auto parts = split(numeric, '.');
    if (parts.size() < 2 || parts.size() > 4) {
        return PackError{PackError::Version,
            "invalid version '" + s + "'",
            "expected format: major.minor[.micro[.build]][-label]"};
    }

    int* fields[] = {&v.major, &v.minor, &v.micro, &v.build};
    for (size_t i = 0; i < parts.size(); ++i) {
        if (!parse_component(parts[i], *fields[i])) {
            return PackError{PackError::Version,
                "invalid version component '" + parts[i] + "' in '" + s + "'"};
        }
    }

    return Result<Version>::ok(std::move(v));
}

std::string Version::to_string() const {
    std::string s = std::to_string(major) + "." +
                    std::to_string(minor) + "." +
                    std::to_string(micro);
    if (build >= 0) {
        s += "." + std::to_string(build);
    }
    if (!label.empty()) {
        s += "-" + label;
    }
    return s;
}

bool Version::operator==(const Version& o) const {
    return major == o.major && minor == o.minor && micro == o.micro &&
           std::max(build, 0) == std::max(o.build, 0) && label == o.label;
}

bool Version::operator!=(const Version& o) const { return !(*this == o); }

bool Version::operator<(const Version& o) const {
    if (major != o.major) return major < o.major;
    if (minor != o.minor) return minor < o.minor;
    if (micro != o.micro) return micro < o.micro;
    int b = std::max(build, 0);
    int ob = std::max(o.build, 0);
    if (b != ob) return b < ob;
    // Pre-release (non-empty label) < release (empty label)
    if (label.empty() && !o.label.empty()) return false;
    if (!label.empty() && o.label.empty()) return true;
    return label < o.label;
}

bool Version::operator<=(const Version& o) const { return !(o < *this); }
bool Version::operator>(const Version& o) const { return o < *this; }
bool Version::operator>=(const Version& o) const { return !(*this < o); }

// ---------------------------------------------------------------------------
// PartialVersion
// ---------------------------------------------------------------------------

Result<PartialVersion> PartialVersion::parse(const std::string& s) {
    if (s.empty()) {
        return PackError{PackError::Version, "empty partial version string"};
    }

    auto parts = split(s, '.');
    if (parts.size() > 3) {
        return PackError{PackError::Version,
            "invalid partial version '" + s + "'"};
    }

    PartialVersion pv;
    int* fields[] = {&pv.major, &pv.minor, &pv.micro};
    for (size_t i = 0; i < parts.size(); ++i) {
        if (!parse_component(parts[i], *fields[i])) {
            return PackError{PackError::Version,
                "invalid partial version '" + s + "'"};
        }
    }

    return Result<PartialVersion>::ok(pv);
}

std::string PartialVersion::to_string() const {
    std::string s = std::to_string(major);
    if (minor >= 0) {
        s += "." + std::to_string(minor);
        if (micro >= 0) {
            s += "." + std::to_string(micro);
        }
    }
    return s;
}

// ---------------------------------------------------------------------------
// VersionConstraint
// ---------------------------------------------------------------------------

bool VersionConstraint::matches(const Version& v) const {
    Version req;
    req.major = version.major;
    req.minor = version.minor >= 0 ? version.minor : 0;
    req.micro = version.micro >= 0 ? version.micro : 0;

    // Build numbers never take part in requirement matching
    Version cmp = v;
    cmp.build = -1;

    if (!cmp.label.empty()) return false;

    switch (op) {
    case ConstraintOp::Exact:
        return cmp.major == req.major && cmp.minor == req.minor &&
               cmp.micro == req.micro;

    case ConstraintOp::Caret:
        if (cmp < req) return false;
        return cmp.major == req.major;

    case ConstraintOp::Tilde:
        if (cmp < req) return false;
        return cmp.major == req.major && cmp.minor == req.minor;

    case ConstraintOp::GreaterEq: return cmp >= req;
    case ConstraintOp::Greater:   return cmp > req;
    case ConstraintOp::LessEq:    return cmp <= req;
    case ConstraintOp::Less:      return cmp < req;
    }
    return false;
}

std::string VersionConstraint::to_string() const {
    std::string prefix;
    switch (op) {
    case ConstraintOp::Exact:     prefix = "="; break;
    case ConstraintOp::Caret:     prefix = "^"; break;
    case ConstraintOp::Tilde:     prefix = "~"; break;
    case ConstraintOp::GreaterEq: prefix = ">="; break;
    case ConstraintOp::Greater:   prefix = ">"; break;
    case ConstraintOp::LessEq:    prefix = "<="; break;
    case ConstraintOp::Less:      prefix = "<"; break;
    }
    return prefix + version.to_string();
}

// ---------------------------------------------------------------------------
// VersionReq
// ---------------------------------------------------------------------------

static Result<VersionConstraint> parse_single_constraint(const std::string& s) {
    size_t pos = 0;
    while (pos < s.size() && s[pos] == ' ') ++pos;

    ConstraintOp op = ConstraintOp::Caret; // no prefix
    if (pos < s.size()) {
        if (s[pos] == '^') {
            op = ConstraintOp::Caret;
            ++pos;
        } else if (s[pos] == '~') {
            op = ConstraintOp::Tilde;
            ++pos;
        } else if (s[pos] == '=') {
            op = ConstraintOp::Exact;
            ++pos;
        } else if (s.compare(pos, 2, ">=") == 0) {
            op = ConstraintOp::GreaterEq;
            pos += 2;
        } else if (s[pos] == '>') {
            op = ConstraintOp::Greater;
            ++pos;
        } else if (s.compare(pos, 2, "<=") == 0) {
            op = ConstraintOp::LessEq;
            pos += 2;
        } else if (s[pos] == '<') {
            op = ConstraintOp::Less;
            ++pos;
        }
    }

    while (pos < s.size() && s[pos] == ' ') ++pos;

    std::string ver_str = s.substr(pos);
    while (!ver_str.empty() && ver_str.back() == ' ') ver_str.pop_back();

    if (ver_str.empty()) {
        return PackError{PackError::Version,
            "missing version in constraint '" + s + "'"};
    }

    auto pv = PartialVersion::parse(ver_str);
    if (pv.is_err()) return std::move(pv).error();

    return Result<VersionConstraint>::ok(VersionConstraint{op, pv.value()});
}

Result<VersionReq> VersionReq::parse(const std::string& s) {
    if (s.empty()) {
        return PackError{PackError::Version, "empty version requirement"};
    }

    VersionReq req;
    for (const auto& token : split(s, ',')) {
        auto c = parse_single_constraint(token);
        if (c.is_err()) return std::move(c).error();
        req.constraints.push_back(std::move(c).value());
    }

    return Result<VersionReq>::ok(std::move(req));
}

bool VersionReq::matches(const Version& v) const {
    return std::all_of(constraints.begin(), constraints.end(),
        [&](const VersionConstraint& c) { return c.matches(v); });
}

std::string VersionReq::to_string() const {
    std::string s;
    for (size_t i = 0; i < constraints.size(); ++i) {
        if (i > 0) s += ", ";
        s += constraints[i].to_string();
    }
    return s;
}

} // namespace mxpack
