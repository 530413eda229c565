#include <mxpack/error.hpp>

namespace mxpack {

const char* PackError::code_name(Code c) {
    switch (c) {
        case IO:         return "IO";
        case Parse:      return "Parse";
        case InvalidArg: return "InvalidArg";
        case NotFound:   return "NotFound";
        case Network:    return "Network";
        case Config:     return "ConfigurationMissing";
        case Version:    return "VersionUnavailable";
        case Artifact:   return "ArtifactUnavailable";
        case Compile:    return "CompileFailed";
        case Assembly:   return "AssemblyFailed";
    }
    return "Unknown";
}

PackError PackError::compile_failed(std::string msg, std::vector<BuildError> errs) {
    PackError e(Compile, std::move(msg));
    e.problems = std::move(errs);
    return e;
}

std::string PackError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    for (const auto& p : problems) {
        result += "\n  ";
        result += p.to_string();
    }

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    if (!file.empty()) {
        result += "\n  --> ";
        result += file;
        if (line > 0) {
            result += ":";
            result += std::to_string(line);
        }
    }

    return result;
}

} // namespace mxpack
