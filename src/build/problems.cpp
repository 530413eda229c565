#include <mxpack/build/problems.hpp>
#include <mxpack/log.hpp>
#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace mxpack {

const char* const GENERIC_BUILD_FAILURE_MESSAGE =
    "Failed to build the model, please check application logs for details.";

BuildError generic_build_error() {
    return BuildError{"Error", GENERIC_BUILD_FAILURE_MESSAGE, ""};
}

std::string generic_problems_payload() {
    auto problem = nlohmann::json::object({
        {"severity", "Error"},
        {"message", GENERIC_BUILD_FAILURE_MESSAGE},
    });
    auto doc = nlohmann::json::object();
    doc["problems"] = nlohmann::json::array({problem});
    return doc.dump();
}

static std::string string_field(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return "";
    return it->get<std::string>();
}

Result<std::vector<BuildError>> parse_problems(const std::string& json_text) {
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(json_text);
    } catch (const nlohmann::json::parse_error& e) {
        return PackError{PackError::Parse,
            std::string("build error file is not valid JSON: ") + e.what()};
    }

    if (!doc.is_object() || !doc.contains("problems") || !doc["problems"].is_array()) {
        return PackError{PackError::Parse,
            "build error file has no 'problems' array"};
    }

    std::vector<BuildError> errors;
    for (const auto& item : doc["problems"]) {
        if (!item.is_object()) continue;
        BuildError e;
        e.severity = string_field(item, "severity");
        e.message = string_field(item, "message");
        e.location = string_field(item, "locationName");
        if (e.severity.empty()) e.severity = "Error";
        errors.push_back(std::move(e));
    }

    return Result<std::vector<BuildError>>::ok(std::move(errors));
}

std::vector<BuildError> load_problems_or_generic(const fs::path& error_file) {
    std::error_code ec;
    if (!fs::exists(error_file, ec)) {
        log::debug("no build error file at %s", error_file.c_str());
        return {generic_build_error()};
    }

    std::ifstream in(error_file, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();

    auto parsed = parse_problems(ss.str());
    if (parsed.is_err()) {
        log::warn("%s", parsed.error().message.c_str());
        return {generic_build_error()};
    }
    if (parsed.value().empty()) {
        return {generic_build_error()};
    }
    return std::move(parsed).value();
}

} // namespace mxpack
