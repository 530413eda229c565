#pragma once

#include <mxpack/result.hpp>
#include <mxpack/build_error.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace mxpack {

// Message of the synthetic problem used when the compiler left no error file
extern const char* const GENERIC_BUILD_FAILURE_MESSAGE;

// The single "Error" problem reported when nothing better is known
BuildError generic_build_error();

// {"problems":[{"severity":"Error","message":"..."}]}
std::string generic_problems_payload();

// Parse the compiler's structured error document. Problems keep the order
// of the "problems" array.
Result<std::vector<BuildError>> parse_problems(const std::string& json_text);

// Problems from the error file when it exists and parses, otherwise the
// single generic problem.
std::vector<BuildError> load_problems_or_generic(const std::filesystem::path& error_file);

} // namespace mxpack
